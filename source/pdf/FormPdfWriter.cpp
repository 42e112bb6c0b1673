// ============================================================================
// FormPdfWriter - Writes form fields into a copy of a PDF using MuPDF
// ============================================================================

#include "FormPdfWriter.h"
#include "AnnotationSynthesizer.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QHash>
#include <QMap>

#include <cstring>

/// Default appearance for the form as a whole.
static const char* const ACROFORM_DA = "/Helv 0 Tf 0 g";

// ============================================================================
// Construction / Destruction
// ============================================================================

FormPdfWriter::FormPdfWriter(QObject* parent)
    : QObject(parent)
{
}

FormPdfWriter::~FormPdfWriter()
{
    cleanup();
}

// ============================================================================
// Public API
// ============================================================================

QString FormPdfWriter::stagingPathFor(const QString& outputPath)
{
    QFileInfo info(outputPath);
    return info.absoluteDir().filePath(QStringLiteral(".%1.part").arg(info.fileName()));
}

QString FormPdfWriter::backupPathFor(const QString& outputPath)
{
    QFileInfo info(outputPath);
    return info.absoluteDir().filePath(QStringLiteral(".%1.bak").arg(info.fileName()));
}

bool FormPdfWriter::replaceWithStaged(const QString& stagingPath, const QString& outputPath,
                                      QString* errorMessage)
{
    auto failWith = [&](const QString& message) {
        QFile::remove(stagingPath);
        if (errorMessage) {
            *errorMessage = message;
        }
        return false;
    };

    if (!QFile::exists(outputPath)) {
        if (!QFile::rename(stagingPath, outputPath)) {
            return failWith(tr("Cannot move staged file to %1").arg(outputPath));
        }
        return true;
    }

    // The previous file stays on disk until the new one is in place
    const QString backupPath = backupPathFor(outputPath);
    QFile::remove(backupPath);
    if (!QFile::rename(outputPath, backupPath)) {
        return failWith(tr("Cannot replace %1").arg(outputPath));
    }

    if (!QFile::rename(stagingPath, outputPath)) {
        if (!QFile::rename(backupPath, outputPath)) {
            qWarning() << "[FormPdfWriter] Could not restore" << outputPath
                       << "from" << backupPath;
        }
        return failWith(tr("Cannot move staged file to %1").arg(outputPath));
    }

    if (!QFile::remove(backupPath)) {
        qWarning() << "[FormPdfWriter] Failed to delete backup" << backupPath;
    }
    return true;
}

FieldWriteResult FormPdfWriter::fail(FieldWriteResult result, const QString& message)
{
    result.success = false;
    result.errorKind = FormErrorKind::Write;
    result.errorMessage = m_stepError.isEmpty()
        ? message
        : QStringLiteral("%1: %2").arg(message, m_stepError);
    qWarning() << "[FormPdfWriter]" << result.errorMessage;
    cleanup();
    emit writeFailed(result.errorMessage);
    return result;
}

FieldWriteResult FormPdfWriter::writeFields(const FieldWriteOptions& options)
{
    FieldWriteResult result;
    m_stepError.clear();

    if (options.sourcePath.isEmpty() || options.outputPath.isEmpty()) {
        return fail(result, tr("No source or output path specified"));
    }
    if (!QFile::exists(options.sourcePath)) {
        return fail(result, tr("Source PDF not found: %1").arg(options.sourcePath));
    }

    qDebug() << "[FormPdfWriter] Writing" << options.fields.size() << "fields from"
             << options.sourcePath << "to" << options.outputPath;

    if (!initContext()) {
        return fail(result, tr("Failed to initialize PDF engine"));
    }
    if (!openSource(options.sourcePath)) {
        return fail(result, tr("Failed to open source PDF %1").arg(options.sourcePath));
    }
    if (!graftPages()) {
        return fail(result, tr("Failed to copy pages of %1").arg(options.sourcePath));
    }
    if (!stripExistingForm()) {
        return fail(result, tr("Failed to remove existing form fields"));
    }

    int fieldsWritten = 0;
    if (!options.fields.isEmpty() && !transplantWidgets(options.fields, fieldsWritten)) {
        return fail(result, tr("Failed to add form fields"));
    }

    const QString stagingPath = stagingPathFor(options.outputPath);
    QFile::remove(stagingPath);
    if (!saveDocument(stagingPath)) {
        QFile::remove(stagingPath);
        return fail(result, tr("Failed to write %1").arg(stagingPath));
    }

    fz_try(m_ctx) {
        result.pagesWritten = pdf_count_pages(m_ctx, m_outputDoc);
    }
    fz_catch(m_ctx) {
        result.pagesWritten = 0;
    }

    // Source must be closed before the move: output may be the source itself
    cleanup();

    QString moveError;
    if (!replaceWithStaged(stagingPath, options.outputPath, &moveError)) {
        return fail(result, moveError);
    }

    result.success = true;
    result.fieldsWritten = fieldsWritten;
    result.fileSizeBytes = QFileInfo(options.outputPath).size();

    qDebug() << "[FormPdfWriter] Write complete:"
             << result.pagesWritten << "pages,"
             << result.fieldsWritten << "fields,"
             << (result.fileSizeBytes / 1024) << "KB";

    emit writeComplete(options.outputPath);
    return result;
}

// ============================================================================
// Initialization
// ============================================================================

bool FormPdfWriter::initContext()
{
    cleanup();

    m_ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!m_ctx) {
        qWarning() << "[FormPdfWriter] Failed to create MuPDF context";
        return false;
    }

    fz_try(m_ctx) {
        fz_register_document_handlers(m_ctx);
        m_outputDoc = pdf_create_document(m_ctx);
    }
    fz_catch(m_ctx) {
        m_stepError = QString::fromUtf8(fz_caught_message(m_ctx));
        qWarning() << "[FormPdfWriter] Failed to initialize:" << m_stepError;
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
        m_outputDoc = nullptr;
        return false;
    }

    return true;
}

void FormPdfWriter::cleanup()
{
    if (!m_ctx) {
        return;
    }
    if (m_sourcePdf) {
        pdf_drop_document(m_ctx, m_sourcePdf);
        m_sourcePdf = nullptr;
    }
    if (m_outputDoc) {
        pdf_drop_document(m_ctx, m_outputDoc);
        m_outputDoc = nullptr;
    }
    fz_drop_context(m_ctx);
    m_ctx = nullptr;
}

bool FormPdfWriter::openSource(const QString& sourcePath)
{
    QByteArray pathUtf8 = sourcePath.toUtf8();

    fz_try(m_ctx) {
        m_sourcePdf = pdf_open_document(m_ctx, pathUtf8.constData());
    }
    fz_catch(m_ctx) {
        m_stepError = QString::fromUtf8(fz_caught_message(m_ctx));
        qWarning() << "[FormPdfWriter] Failed to open source PDF:" << m_stepError;
        m_sourcePdf = nullptr;
        return false;
    }

    if (pdf_needs_password(m_ctx, m_sourcePdf)) {
        m_stepError = tr("document is password protected");
        return false;
    }
    return true;
}

// ============================================================================
// Page Grafting
// ============================================================================

bool FormPdfWriter::graftPages()
{
    pdf_graft_map* graftMap = nullptr;
    fz_var(graftMap);

    fz_try(m_ctx) {
        // One map for all pages so shared resources (fonts, images) are copied once
        graftMap = pdf_new_graft_map(m_ctx, m_outputDoc);

        // Source page object number -> output page index
        QHash<int, int> pageMap;
        int pageCount = pdf_count_pages(m_ctx, m_sourcePdf);
        for (int i = 0; i < pageCount; ++i) {
            pdf_graft_mapped_page(m_ctx, graftMap, -1, m_sourcePdf, i);
            pageMap.insert(pdf_to_num(m_ctx, pdf_lookup_page_obj(m_ctx, m_sourcePdf, i)), i);
        }

        // Annotations last: links may point at any page
        for (int i = 0; i < pageCount; ++i) {
            graftPageAnnotations(graftMap, i, pageMap);
        }
    }
    fz_always(m_ctx) {
        pdf_drop_graft_map(m_ctx, graftMap);
    }
    fz_catch(m_ctx) {
        m_stepError = QString::fromUtf8(fz_caught_message(m_ctx));
        qWarning() << "[FormPdfWriter] Failed to graft pages:" << m_stepError;
        return false;
    }

    return true;
}

/**
 * @brief Copy the non-widget annotations of a source page onto its grafted copy.
 *
 * Page grafting leaves /Annots behind. Markup annotations are copied without
 * their back references (/P, /Popup, /IRT, /Parent), which would otherwise
 * drag the source page tree into the output. Link destinations are rebuilt
 * against the output pages by relinkDestinations(). Widgets and popups are
 * skipped.
 *
 * Throws (MuPDF) on failure; called inside graftPages()' fz_try.
 */
void FormPdfWriter::graftPageAnnotations(pdf_graft_map* graftMap, int pageIndex,
                                         const QHash<int, int>& pageMap)
{
    pdf_obj* srcPage = pdf_lookup_page_obj(m_ctx, m_sourcePdf, pageIndex);
    pdf_obj* srcAnnots = pdf_dict_get(m_ctx, srcPage, PDF_NAME(Annots));
    int count = pdf_array_len(m_ctx, srcAnnots);
    if (count == 0) {
        return;
    }

    pdf_obj* dstPage = pdf_lookup_page_obj(m_ctx, m_outputDoc, pageIndex);
    pdf_obj* dstAnnots = nullptr;

    for (int i = 0; i < count; ++i) {
        pdf_obj* annot = pdf_array_get(m_ctx, srcAnnots, i);
        pdf_obj* subtype = pdf_dict_get(m_ctx, annot, PDF_NAME(Subtype));
        if (pdf_name_eq(m_ctx, subtype, PDF_NAME(Widget)) ||
            pdf_name_eq(m_ctx, subtype, PDF_NAME(Popup))) {
            continue;
        }

        pdf_obj* copy = nullptr;
        pdf_obj* grafted = nullptr;
        pdf_obj* ref = nullptr;
        fz_var(copy);
        fz_var(grafted);
        fz_var(ref);
        fz_try(m_ctx) {
            copy = pdf_copy_dict(m_ctx, annot);
            pdf_dict_del(m_ctx, copy, PDF_NAME(P));
            pdf_dict_del(m_ctx, copy, PDF_NAME(Popup));
            pdf_dict_del(m_ctx, copy, PDF_NAME(IRT));
            pdf_dict_del(m_ctx, copy, PDF_NAME(Parent));
            pdf_dict_del(m_ctx, copy, PDF_NAME(Dest));
            pdf_dict_del(m_ctx, copy, PDF_NAME(A));

            grafted = pdf_graft_mapped_object(m_ctx, graftMap, copy);
            ref = pdf_add_object(m_ctx, m_outputDoc, grafted);
            pdf_dict_put(m_ctx, ref, PDF_NAME(P), dstPage);
            relinkDestinations(graftMap, annot, ref, pageMap);

            if (!dstAnnots) {
                dstAnnots = pdf_dict_put_array(m_ctx, dstPage, PDF_NAME(Annots), count);
            }
            pdf_array_push(m_ctx, dstAnnots, ref);
        }
        fz_always(m_ctx) {
            pdf_drop_obj(m_ctx, ref);
            pdf_drop_obj(m_ctx, grafted);
            pdf_drop_obj(m_ctx, copy);
        }
        fz_catch(m_ctx) {
            fz_rethrow(m_ctx);
        }
    }
}

/**
 * @brief Carry /Dest and /A over from a source annotation to its copy.
 *
 * A GoTo whose page is not in the output is dropped. /Next action chains
 * are not carried.
 *
 * Throws (MuPDF) on failure.
 */
void FormPdfWriter::relinkDestinations(pdf_graft_map* graftMap, pdf_obj* srcAnnot,
                                       pdf_obj* dstAnnot, const QHash<int, int>& pageMap)
{
    pdf_obj* dest = pdf_dict_get(m_ctx, srcAnnot, PDF_NAME(Dest));
    if (dest) {
        pdf_obj* mapped = mapDestination(graftMap, dest, pageMap);
        if (mapped) {
            pdf_dict_put_drop(m_ctx, dstAnnot, PDF_NAME(Dest), mapped);
        }
    }

    pdf_obj* action = pdf_dict_get(m_ctx, srcAnnot, PDF_NAME(A));
    if (!pdf_is_dict(m_ctx, action)) {
        return;
    }

    pdf_obj* actionCopy = nullptr;
    pdf_obj* graftedAction = nullptr;
    pdf_obj* mappedDest = nullptr;
    fz_var(actionCopy);
    fz_var(graftedAction);
    fz_var(mappedDest);
    fz_try(m_ctx) {
        pdf_obj* actionDest = pdf_dict_get(m_ctx, action, PDF_NAME(D));
        bool keep = true;
        if (actionDest) {
            mappedDest = mapDestination(graftMap, actionDest, pageMap);
            keep = mappedDest != nullptr;
        }

        if (keep) {
            actionCopy = pdf_copy_dict(m_ctx, action);
            pdf_dict_del(m_ctx, actionCopy, PDF_NAME(D));
            pdf_dict_del(m_ctx, actionCopy, PDF_NAME(Next));
            graftedAction = pdf_graft_mapped_object(m_ctx, graftMap, actionCopy);
            if (mappedDest) {
                pdf_dict_put(m_ctx, graftedAction, PDF_NAME(D), mappedDest);
            }
            pdf_dict_put(m_ctx, dstAnnot, PDF_NAME(A), graftedAction);
        }
    }
    fz_always(m_ctx) {
        pdf_drop_obj(m_ctx, mappedDest);
        pdf_drop_obj(m_ctx, graftedAction);
        pdf_drop_obj(m_ctx, actionCopy);
    }
    fz_catch(m_ctx) {
        fz_rethrow(m_ctx);
    }
}

/**
 * @brief Rebuild a destination in the output document.
 * @return New object (caller drops), or nullptr if it names a page that is
 *         not part of the source page tree.
 *
 * Explicit destinations ([page /XYZ ...]) get the output page in place of
 * the source page. Named and remote destinations are grafted as they are.
 */
pdf_obj* FormPdfWriter::mapDestination(pdf_graft_map* graftMap, pdf_obj* dest,
                                       const QHash<int, int>& pageMap)
{
    if (!pdf_is_array(m_ctx, dest)) {
        return pdf_graft_mapped_object(m_ctx, graftMap, dest);
    }

    pdf_obj* target = pdf_array_get(m_ctx, dest, 0);
    if (!pdf_is_indirect(m_ctx, target)) {
        return pdf_graft_mapped_object(m_ctx, graftMap, dest);
    }

    auto it = pageMap.constFind(pdf_to_num(m_ctx, target));
    if (it == pageMap.constEnd()) {
        return nullptr;
    }

    int len = pdf_array_len(m_ctx, dest);
    pdf_obj* mapped = pdf_new_array(m_ctx, m_outputDoc, len);
    fz_try(m_ctx) {
        pdf_array_push(m_ctx, mapped, pdf_lookup_page_obj(m_ctx, m_outputDoc, it.value()));
        for (int i = 1; i < len; ++i) {
            pdf_array_push_drop(m_ctx, mapped,
                pdf_graft_mapped_object(m_ctx, graftMap, pdf_array_get(m_ctx, dest, i)));
        }
    }
    fz_catch(m_ctx) {
        pdf_drop_obj(m_ctx, mapped);
        fz_rethrow(m_ctx);
    }
    return mapped;
}

// ============================================================================
// Form Stripping
// ============================================================================

bool FormPdfWriter::stripExistingForm()
{
    int removed = 0;

    fz_try(m_ctx) {
        int pageCount = pdf_count_pages(m_ctx, m_outputDoc);
        for (int i = 0; i < pageCount; ++i) {
            pdf_obj* page = pdf_lookup_page_obj(m_ctx, m_outputDoc, i);
            pdf_obj* annots = pdf_dict_get(m_ctx, page, PDF_NAME(Annots));
            if (!pdf_is_array(m_ctx, annots)) {
                continue;
            }

            for (int j = pdf_array_len(m_ctx, annots) - 1; j >= 0; --j) {
                pdf_obj* annot = pdf_array_get(m_ctx, annots, j);
                if (pdf_name_eq(m_ctx, pdf_dict_get(m_ctx, annot, PDF_NAME(Subtype)),
                                PDF_NAME(Widget))) {
                    pdf_array_delete(m_ctx, annots, j);
                    ++removed;
                }
            }

            if (pdf_array_len(m_ctx, annots) == 0) {
                pdf_dict_del(m_ctx, page, PDF_NAME(Annots));
            }
        }

        pdf_obj* root = pdf_dict_get(m_ctx, pdf_trailer(m_ctx, m_outputDoc), PDF_NAME(Root));
        pdf_dict_del(m_ctx, root, PDF_NAME(AcroForm));
    }
    fz_catch(m_ctx) {
        m_stepError = QString::fromUtf8(fz_caught_message(m_ctx));
        qWarning() << "[FormPdfWriter] Failed to strip form:" << m_stepError;
        return false;
    }

    if (removed > 0) {
        qDebug() << "[FormPdfWriter] Removed" << removed << "existing widgets";
    }
    return true;
}

// ============================================================================
// Widget Transplant
// ============================================================================

/**
 * @brief Add a standard Type1 font resource to the output document.
 * @return Indirect reference (caller drops).
 */
static pdf_obj* addStandardFont(fz_context* ctx, pdf_document* doc, const char* baseFont,
                                bool winAnsi)
{
    pdf_obj* font = pdf_add_new_dict(ctx, doc, 4);
    fz_try(ctx) {
        pdf_dict_put(ctx, font, PDF_NAME(Type), PDF_NAME(Font));
        pdf_dict_put(ctx, font, PDF_NAME(Subtype), PDF_NAME(Type1));
        pdf_dict_put_name(ctx, font, PDF_NAME(BaseFont), baseFont);
        if (winAnsi) {
            pdf_dict_put(ctx, font, PDF_NAME(Encoding), PDF_NAME(WinAnsiEncoding));
        }
    }
    fz_catch(ctx) {
        pdf_drop_obj(ctx, font);
        fz_rethrow(ctx);
    }
    return font;
}

bool FormPdfWriter::transplantWidgets(const QVector<FormField>& fields, int& fieldsWritten)
{
    fieldsWritten = 0;

    // Scratch pages mirror each output page's MediaBox
    QMap<int, QRectF> mediaBoxes;
    fz_try(m_ctx) {
        int pageCount = pdf_count_pages(m_ctx, m_outputDoc);
        for (int i = 0; i < pageCount; ++i) {
            pdf_obj* page = pdf_lookup_page_obj(m_ctx, m_outputDoc, i);
            fz_rect box = pdf_to_rect(m_ctx,
                pdf_dict_get_inheritable(m_ctx, page, PDF_NAME(MediaBox)));
            mediaBoxes.insert(i, QRectF(box.x0, box.y0, box.x1 - box.x0, box.y1 - box.y0));
        }
    }
    fz_catch(m_ctx) {
        m_stepError = QString::fromUtf8(fz_caught_message(m_ctx));
        return false;
    }

    AnnotationSynthesizer synthesizer(m_ctx);
    if (!synthesizer.synthesize(fields, mediaBoxes)) {
        m_stepError = synthesizer.errorMessage();
        return false;
    }

    pdf_graft_map* graftMap = nullptr;
    pdf_obj* acroForm = nullptr;
    pdf_obj* helv = nullptr;
    pdf_obj* zadb = nullptr;
    fz_var(graftMap);
    fz_var(acroForm);
    fz_var(helv);
    fz_var(zadb);
    fz_var(fieldsWritten);

    fz_try(m_ctx) {
        graftMap = pdf_new_graft_map(m_ctx, m_outputDoc);

        acroForm = pdf_add_new_dict(m_ctx, m_outputDoc, 4);
        pdf_obj* fieldRefs = pdf_dict_put_array(m_ctx, acroForm, PDF_NAME(Fields),
                                                synthesizer.widgetCount());

        for (const SynthesizedPage& synthesized : synthesizer.pages()) {
            pdf_obj* outPage = pdf_lookup_page_obj(m_ctx, m_outputDoc, synthesized.pageIndex);
            pdf_obj* annots = pdf_dict_get(m_ctx, outPage, PDF_NAME(Annots));
            if (!pdf_is_array(m_ctx, annots)) {
                annots = pdf_dict_put_array(m_ctx, outPage, PDF_NAME(Annots),
                                            synthesized.widgets.size());
            }

            for (pdf_obj* widget : synthesized.widgets) {
                // Detach from the scratch page so grafting copies only the widget
                pdf_dict_del(m_ctx, widget, PDF_NAME(P));

                pdf_obj* grafted = pdf_graft_mapped_object(m_ctx, graftMap, widget);
                fz_try(m_ctx) {
                    pdf_dict_put(m_ctx, grafted, PDF_NAME(P), outPage);

                    pdf_obj* mk = pdf_dict_get(m_ctx, grafted, PDF_NAME(MK));
                    if (pdf_is_dict(m_ctx, mk)) {
                        pdf_dict_del(m_ctx, mk, PDF_NAME(BG));
                    }
                    pdf_obj* border = pdf_dict_put_array(m_ctx, grafted, PDF_NAME(Border), 3);
                    pdf_array_push_int(m_ctx, border, 0);
                    pdf_array_push_int(m_ctx, border, 0);
                    pdf_array_push_int(m_ctx, border, 0);

                    pdf_array_push(m_ctx, annots, grafted);
                    pdf_array_push(m_ctx, fieldRefs, grafted);
                    ++fieldsWritten;
                }
                fz_always(m_ctx) {
                    pdf_drop_obj(m_ctx, grafted);
                }
                fz_catch(m_ctx) {
                    fz_rethrow(m_ctx);
                }
            }
        }

        pdf_dict_put_bool(m_ctx, acroForm, PDF_NAME(NeedAppearances), 1);
        pdf_dict_put_string(m_ctx, acroForm, PDF_NAME(DA), ACROFORM_DA, strlen(ACROFORM_DA));

        pdf_obj* dr = pdf_dict_put_dict(m_ctx, acroForm, PDF_NAME(DR), 1);
        pdf_obj* fonts = pdf_dict_put_dict(m_ctx, dr, PDF_NAME(Font), 2);
        helv = addStandardFont(m_ctx, m_outputDoc, "Helvetica", true);
        zadb = addStandardFont(m_ctx, m_outputDoc, "ZapfDingbats", false);
        pdf_dict_puts(m_ctx, fonts, "Helv", helv);
        pdf_dict_puts(m_ctx, fonts, "ZaDb", zadb);

        pdf_obj* root = pdf_dict_get(m_ctx, pdf_trailer(m_ctx, m_outputDoc), PDF_NAME(Root));
        pdf_dict_put(m_ctx, root, PDF_NAME(AcroForm), acroForm);
    }
    fz_always(m_ctx) {
        pdf_drop_obj(m_ctx, zadb);
        pdf_drop_obj(m_ctx, helv);
        pdf_drop_obj(m_ctx, acroForm);
        pdf_drop_graft_map(m_ctx, graftMap);
    }
    fz_catch(m_ctx) {
        m_stepError = QString::fromUtf8(fz_caught_message(m_ctx));
        qWarning() << "[FormPdfWriter] Failed to transplant widgets:" << m_stepError;
        return false;
    }

    return true;
}

// ============================================================================
// Save
// ============================================================================

bool FormPdfWriter::saveDocument(const QString& path)
{
    if (!m_outputDoc || !m_ctx) {
        return false;
    }

    QByteArray pathUtf8 = path.toUtf8();

    fz_try(m_ctx) {
        pdf_write_options opts = pdf_default_write_options;
        opts.do_compress = 1;       // Compress streams
        opts.do_garbage = 1;        // Drop objects orphaned by stripping

        pdf_save_document(m_ctx, m_outputDoc, pathUtf8.constData(), &opts);
    }
    fz_catch(m_ctx) {
        m_stepError = QString::fromUtf8(fz_caught_message(m_ctx));
        qWarning() << "[FormPdfWriter] Failed to save document:" << m_stepError;
        return false;
    }

    qDebug() << "[FormPdfWriter] Saved to" << path;
    return true;
}
