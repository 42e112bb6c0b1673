// ============================================================================
// FormFieldImporter - Reads existing AcroForm widgets into FormFields
// ============================================================================

#include "FormFieldImporter.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QDebug>
#include <QObject>

#include <algorithm>

/// Field flag bit 2 (value 2): the field is required.
static constexpr int FIELD_FLAG_REQUIRED = 2;

/**
 * @brief True if a /V or /AS value names an "on" state.
 */
static bool isOnState(fz_context* ctx, pdf_obj* value)
{
    if (!value) {
        return false;
    }
    QString state;
    if (pdf_is_name(ctx, value)) {
        state = QString::fromUtf8(pdf_to_name(ctx, value));
    } else if (pdf_is_string(ctx, value)) {
        state = QString::fromUtf8(pdf_to_text_string(ctx, value));
    } else {
        return false;
    }
    return !state.isEmpty() && state != QStringLiteral("Off");
}

/**
 * @brief Field name: /T of the widget, else of its parent, else empty.
 */
static QString widgetName(fz_context* ctx, pdf_obj* widget)
{
    pdf_obj* name = pdf_dict_get(ctx, widget, PDF_NAME(T));
    if (!name) {
        pdf_obj* parent = pdf_dict_get(ctx, widget, PDF_NAME(Parent));
        name = pdf_dict_get(ctx, parent, PDF_NAME(T));
    }
    return name ? QString::fromUtf8(pdf_to_text_string(ctx, name)) : QString();
}

FieldImportResult FormFieldImporter::importFields(const QString& pdfPath)
{
    FieldImportResult result;

    fz_context* ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!ctx) {
        result.errorKind = FormErrorKind::Import;
        result.errorMessage = QObject::tr("Failed to initialize PDF engine");
        qWarning() << "[FormFieldImporter]" << result.errorMessage;
        return result;
    }

    QByteArray pathUtf8 = pdfPath.toUtf8();
    pdf_document* doc = nullptr;
    QVector<FormField> fields;
    int skipped = 0;
    fz_var(doc);
    fz_var(fields);
    fz_var(skipped);

    fz_try(ctx) {
        doc = pdf_open_document(ctx, pathUtf8.constData());
        if (pdf_needs_password(ctx, doc)) {
            fz_throw(ctx, FZ_ERROR_GENERIC, "document is password protected");
        }

        int pageCount = pdf_count_pages(ctx, doc);
        for (int pageIndex = 0; pageIndex < pageCount; ++pageIndex) {
            pdf_obj* page = pdf_lookup_page_obj(ctx, doc, pageIndex);
            pdf_obj* annots = pdf_dict_get(ctx, page, PDF_NAME(Annots));
            int annotCount = pdf_array_len(ctx, annots);

            for (int i = 0; i < annotCount; ++i) {
                pdf_obj* annot = pdf_array_get(ctx, annots, i);
                if (!pdf_name_eq(ctx, pdf_dict_get(ctx, annot, PDF_NAME(Subtype)),
                                 PDF_NAME(Widget))) {
                    continue;
                }

                pdf_obj* ft = pdf_dict_get_inheritable(ctx, annot, PDF_NAME(FT));
                pdf_obj* rectObj = pdf_dict_get(ctx, annot, PDF_NAME(Rect));
                if (!ft || !pdf_is_array(ctx, rectObj)) {
                    ++skipped;
                    continue;
                }

                FormField field;
                if (pdf_name_eq(ctx, ft, PDF_NAME(Tx))) {
                    field.type = FieldType::Text;
                    pdf_obj* value = pdf_dict_get_inheritable(ctx, annot, PDF_NAME(V));
                    if (pdf_is_string(ctx, value)) {
                        field.defaultValue = QString::fromUtf8(pdf_to_text_string(ctx, value));
                    } else if (pdf_is_name(ctx, value)) {
                        field.defaultValue = QString::fromUtf8(pdf_to_name(ctx, value));
                    }
                } else if (pdf_name_eq(ctx, ft, PDF_NAME(Btn))) {
                    field.type = FieldType::Checkbox;
                    field.checked =
                        isOnState(ctx, pdf_dict_get_inheritable(ctx, annot, PDF_NAME(V))) ||
                        isOnState(ctx, pdf_dict_get(ctx, annot, PDF_NAME(AS)));
                } else {
                    ++skipped;
                    continue;
                }

                fz_rect rect = pdf_to_rect(ctx, rectObj);
                field.x = std::min(rect.x0, rect.x1);
                field.y = std::min(rect.y0, rect.y1);
                field.width = std::max(0.0f, std::max(rect.x0, rect.x1) - std::min(rect.x0, rect.x1));
                field.height = std::max(0.0f, std::max(rect.y0, rect.y1) - std::min(rect.y0, rect.y1));

                field.page = pageIndex;
                field.name = widgetName(ctx, annot);
                int flags = pdf_to_int(ctx, pdf_dict_get_inheritable(ctx, annot, PDF_NAME(Ff)));
                field.required = (flags & FIELD_FLAG_REQUIRED) != 0;

                fields.append(field);
            }
        }
    }
    fz_always(ctx) {
        pdf_drop_document(ctx, doc);
    }
    fz_catch(ctx) {
        result.errorKind = FormErrorKind::Import;
        result.errorMessage = QObject::tr("Failed to import form fields from %1: %2")
                                  .arg(pdfPath, QString::fromUtf8(fz_caught_message(ctx)));
        qWarning() << "[FormFieldImporter]" << result.errorMessage;
        fz_drop_context(ctx);
        return result;
    }

    fz_drop_context(ctx);

    result.success = true;
    result.fields = fields;
    result.skippedWidgets = skipped;

    qDebug() << "[FormFieldImporter] Imported" << fields.size() << "fields from" << pdfPath
             << "(skipped" << skipped << ")";
    return result;
}
