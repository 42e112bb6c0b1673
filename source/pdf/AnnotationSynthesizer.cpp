// ============================================================================
// AnnotationSynthesizer - Builds PDF widget annotations for form fields
// ============================================================================

#include "AnnotationSynthesizer.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QDebug>
#include <QObject>

#include <cstring>

/// Default appearance strings. Font size 0 lets the viewer auto-size.
static const char* const TEXT_DA = "/Helv 0 Tf 0 g";
static const char* const CHECKBOX_DA = "/ZaDb 0 Tf 0 g";

/// ZapfDingbats glyph "4" is the check mark.
static const char* const CHECKBOX_CHECK_CAPTION = "4";

/// Annotation flag bit 3: print the widget.
static constexpr int ANNOT_FLAG_PRINT = 4;

// ============================================================================
// Construction / Destruction
// ============================================================================

AnnotationSynthesizer::AnnotationSynthesizer(fz_context* ctx)
    : m_ctx(ctx)
{
}

AnnotationSynthesizer::~AnnotationSynthesizer()
{
    release();
}

void AnnotationSynthesizer::release()
{
    if (!m_ctx) {
        return;
    }
    for (SynthesizedPage& page : m_pages) {
        for (pdf_obj* widget : page.widgets) {
            pdf_drop_obj(m_ctx, widget);
        }
        pdf_drop_obj(m_ctx, page.page);
    }
    m_pages.clear();

    if (m_scratch) {
        pdf_drop_document(m_ctx, m_scratch);
        m_scratch = nullptr;
    }
}

int AnnotationSynthesizer::widgetCount() const
{
    int count = 0;
    for (const SynthesizedPage& page : m_pages) {
        count += page.widgets.size();
    }
    return count;
}

// ============================================================================
// Synthesis
// ============================================================================

bool AnnotationSynthesizer::synthesize(const QVector<FormField>& fields,
                                       const QMap<int, QRectF>& mediaBoxes)
{
    release();
    m_errorMessage.clear();

    if (!m_ctx) {
        m_errorMessage = QObject::tr("No PDF engine context");
        return false;
    }

    // Group by page, keeping field order within each page
    QMap<int, QVector<const FormField*>> byPage;
    for (const FormField& field : fields) {
        if (!field.page.has_value()) {
            m_errorMessage = QObject::tr("Field \"%1\" has no page").arg(field.name);
            return false;
        }
        if (field.name.isEmpty()) {
            m_errorMessage = QObject::tr("A field on page %1 has no name").arg(*field.page + 1);
            return false;
        }
        if (!mediaBoxes.contains(*field.page)) {
            m_errorMessage = QObject::tr("Field \"%1\" references missing page %2")
                                 .arg(field.name).arg(*field.page + 1);
            return false;
        }
        byPage[*field.page].append(&field);
    }

    fz_try(m_ctx) {
        m_scratch = pdf_create_document(m_ctx);
    }
    fz_catch(m_ctx) {
        m_errorMessage = QObject::tr("Failed to create scratch document: %1")
                             .arg(QString::fromUtf8(fz_caught_message(m_ctx)));
        qWarning() << "[AnnotationSynthesizer]" << m_errorMessage;
        return false;
    }

    for (auto it = byPage.constBegin(); it != byPage.constEnd(); ++it) {
        SynthesizedPage synthesized;
        synthesized.pageIndex = it.key();
        synthesized.page = addScratchPage(mediaBoxes.value(it.key()));
        if (!synthesized.page) {
            m_errorMessage = QObject::tr("Failed to create scratch page %1").arg(it.key() + 1);
            release();
            return false;
        }
        // Registered before widgets are built so release() always sees it
        m_pages.append(synthesized);
        SynthesizedPage& current = m_pages.last();

        for (const FormField* field : it.value()) {
            pdf_obj* widget = buildWidget(*field, current.page);
            if (!widget) {
                m_errorMessage = QObject::tr("Failed to build widget \"%1\" on page %2")
                                     .arg(field->name).arg(it.key() + 1);
                release();
                return false;
            }
            current.widgets.append(widget);
        }
    }

    qDebug() << "[AnnotationSynthesizer] Built" << widgetCount() << "widgets on"
             << m_pages.size() << "pages";
    return true;
}

pdf_obj* AnnotationSynthesizer::addScratchPage(const QRectF& mediaBox)
{
    pdf_obj* pageObj = nullptr;
    pdf_obj* pageRef = nullptr;
    fz_var(pageObj);
    fz_var(pageRef);

    fz_try(m_ctx) {
        fz_rect box = fz_make_rect(static_cast<float>(mediaBox.left()),
                                   static_cast<float>(mediaBox.top()),
                                   static_cast<float>(mediaBox.right()),
                                   static_cast<float>(mediaBox.bottom()));
        pageObj = pdf_add_page(m_ctx, m_scratch, box, 0, nullptr, nullptr);
        pdf_insert_page(m_ctx, m_scratch, -1, pageObj);
        pageRef = pdf_keep_obj(m_ctx, pageObj);
    }
    fz_always(m_ctx) {
        pdf_drop_obj(m_ctx, pageObj);
    }
    fz_catch(m_ctx) {
        qWarning() << "[AnnotationSynthesizer] Failed to add scratch page:"
                   << fz_caught_message(m_ctx);
        return nullptr;
    }
    return pageRef;
}

pdf_obj* AnnotationSynthesizer::buildWidget(const FormField& field, pdf_obj* pageRef)
{
    const QByteArray nameUtf8 = field.name.toUtf8();
    const QByteArray valueUtf8 = field.defaultValue.toUtf8();

    pdf_obj* dict = nullptr;
    pdf_obj* widgetRef = nullptr;
    fz_var(dict);
    fz_var(widgetRef);

    fz_try(m_ctx) {
        dict = pdf_new_dict(m_ctx, m_scratch, 16);

        pdf_dict_put(m_ctx, dict, PDF_NAME(Type), PDF_NAME(Annot));
        pdf_dict_put(m_ctx, dict, PDF_NAME(Subtype), PDF_NAME(Widget));
        pdf_dict_put_int(m_ctx, dict, PDF_NAME(F), ANNOT_FLAG_PRINT);
        pdf_dict_put_text_string(m_ctx, dict, PDF_NAME(T), nameUtf8.constData());
        pdf_dict_put_rect(m_ctx, dict, PDF_NAME(Rect),
                          fz_make_rect(static_cast<float>(field.x),
                                       static_cast<float>(field.y),
                                       static_cast<float>(field.x + field.width),
                                       static_cast<float>(field.y + field.height)));
        pdf_dict_put(m_ctx, dict, PDF_NAME(P), pageRef);

        // No visible border
        pdf_obj* border = pdf_dict_put_array(m_ctx, dict, PDF_NAME(Border), 3);
        pdf_array_push_int(m_ctx, border, 0);
        pdf_array_push_int(m_ctx, border, 0);
        pdf_array_push_int(m_ctx, border, 0);
        pdf_obj* bs = pdf_dict_put_dict(m_ctx, dict, PDF_NAME(BS), 1);
        pdf_dict_put_int(m_ctx, bs, PDF_NAME(W), 0);

        if (field.isText()) {
            pdf_dict_put(m_ctx, dict, PDF_NAME(FT), PDF_NAME(Tx));
            if (!field.defaultValue.isEmpty()) {
                pdf_dict_put_text_string(m_ctx, dict, PDF_NAME(V), valueUtf8.constData());
            }
            pdf_dict_put_string(m_ctx, dict, PDF_NAME(DA), TEXT_DA, strlen(TEXT_DA));
        } else {
            pdf_dict_put(m_ctx, dict, PDF_NAME(FT), PDF_NAME(Btn));
            pdf_obj* mk = pdf_dict_put_dict(m_ctx, dict, PDF_NAME(MK), 1);
            pdf_dict_put_text_string(m_ctx, mk, PDF_NAME(CA), CHECKBOX_CHECK_CAPTION);
            pdf_dict_put_string(m_ctx, dict, PDF_NAME(DA), CHECKBOX_DA, strlen(CHECKBOX_DA));

            const char* state = field.checked ? "Yes" : "Off";
            pdf_dict_put_name(m_ctx, dict, PDF_NAME(V), state);
            pdf_dict_put_name(m_ctx, dict, PDF_NAME(AS), state);
        }

        widgetRef = pdf_add_object(m_ctx, m_scratch, dict);

        // List on the scratch page too, so the scratch document is self-consistent
        pdf_obj* annots = pdf_dict_get(m_ctx, pageRef, PDF_NAME(Annots));
        if (!pdf_is_array(m_ctx, annots)) {
            annots = pdf_dict_put_array(m_ctx, pageRef, PDF_NAME(Annots), 4);
        }
        pdf_array_push(m_ctx, annots, widgetRef);
    }
    fz_always(m_ctx) {
        pdf_drop_obj(m_ctx, dict);
    }
    fz_catch(m_ctx) {
        qWarning() << "[AnnotationSynthesizer] Failed to build widget" << field.name
                   << "-" << fz_caught_message(m_ctx);
        pdf_drop_obj(m_ctx, widgetRef);
        return nullptr;
    }

    return widgetRef;
}
