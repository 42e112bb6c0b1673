#ifndef FORMPDFTESTS_H
#define FORMPDFTESTS_H

// ============================================================================
// FormPdfTests - Tests for reading and writing form fields with MuPDF
// ============================================================================
// Sample documents are generated on the fly with MuPDF into a temporary
// directory, so no fixture files are needed.
//
// Run with: pdfformbuilder --test-pdf
// ============================================================================

#include "AnnotationSynthesizer.h"
#include "FormFieldImporter.h"
#include "FormPdfWriter.h"
#include "../core/FormDocument.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QDir>
#include <QFile>
#include <QObject>
#include <QSignalSpy>
#include <QStringList>
#include <QTemporaryDir>
#include <QTest>

#include <cstring>

/**
 * @brief Structure of a written PDF, as far as the tests care.
 */
struct PdfFormSummary {
    bool readable = false;
    int pageCount = 0;
    int acroFormFieldCount = -1;        ///< -1 when the document has no /AcroForm
    bool needAppearances = false;
    QVector<int> widgetsPerPage;
    QStringList otherAnnotations;       ///< Subtypes of non-widget annotations
};

class FormPdfTests : public QObject {
    Q_OBJECT

private:
    QTemporaryDir m_dir;

    QString path(const QString& name) const { return m_dir.filePath(name); }

    static pdf_obj* newAnnot(fz_context* ctx, pdf_document* doc, const char* subtype,
                             pdf_obj* page)
    {
        pdf_obj* annot = pdf_add_new_dict(ctx, doc, 8);
        pdf_dict_put(ctx, annot, PDF_NAME(Type), PDF_NAME(Annot));
        pdf_dict_put_name(ctx, annot, PDF_NAME(Subtype), subtype);
        pdf_dict_put(ctx, annot, PDF_NAME(P), page);
        return annot;
    }

    /**
     * @brief Put a pre-existing form on page 0.
     *
     * Annotations, in order:
     *   - text widget "legacy", required, value "prefilled", rect 50,700,250,724
     *   - kid widget of checkbox field "parentName" (V /Yes), rect 300,700,318,718
     *   - widget without /Rect
     *   - widget without /FT
     *   - choice widget
     *   - a /Text note
     */
    static void addLegacyForm(fz_context* ctx, pdf_document* doc)
    {
        pdf_obj* page = pdf_lookup_page_obj(ctx, doc, 0);
        pdf_obj* annots = pdf_dict_put_array(ctx, page, PDF_NAME(Annots), 6);

        pdf_obj* root = pdf_dict_get(ctx, pdf_trailer(ctx, doc), PDF_NAME(Root));
        pdf_obj* acroForm = pdf_dict_put_dict(ctx, root, PDF_NAME(AcroForm), 2);
        pdf_obj* fields = pdf_dict_put_array(ctx, acroForm, PDF_NAME(Fields), 5);

        pdf_obj* text = newAnnot(ctx, doc, "Widget", page);
        pdf_dict_put_text_string(ctx, text, PDF_NAME(T), "legacy");
        pdf_dict_put_name(ctx, text, PDF_NAME(FT), "Tx");
        pdf_dict_put_int(ctx, text, PDF_NAME(Ff), 2);
        pdf_dict_put_text_string(ctx, text, PDF_NAME(V), "prefilled");
        pdf_dict_put_rect(ctx, text, PDF_NAME(Rect), fz_make_rect(50, 700, 250, 724));
        pdf_array_push(ctx, annots, text);
        pdf_array_push(ctx, fields, text);
        pdf_drop_obj(ctx, text);

        pdf_obj* parent = pdf_add_new_dict(ctx, doc, 4);
        pdf_dict_put_text_string(ctx, parent, PDF_NAME(T), "parentName");
        pdf_dict_put_name(ctx, parent, PDF_NAME(FT), "Btn");
        pdf_dict_put_name(ctx, parent, PDF_NAME(V), "Yes");
        pdf_obj* kids = pdf_dict_put_array(ctx, parent, PDF_NAME(Kids), 1);
        pdf_obj* kid = newAnnot(ctx, doc, "Widget", page);
        pdf_dict_put(ctx, kid, PDF_NAME(Parent), parent);
        pdf_dict_put_name(ctx, kid, PDF_NAME(AS), "Yes");
        pdf_dict_put_rect(ctx, kid, PDF_NAME(Rect), fz_make_rect(300, 700, 318, 718));
        pdf_array_push(ctx, kids, kid);
        pdf_array_push(ctx, annots, kid);
        pdf_array_push(ctx, fields, parent);
        pdf_drop_obj(ctx, kid);
        pdf_drop_obj(ctx, parent);

        pdf_obj* noRect = newAnnot(ctx, doc, "Widget", page);
        pdf_dict_put_text_string(ctx, noRect, PDF_NAME(T), "norect");
        pdf_dict_put_name(ctx, noRect, PDF_NAME(FT), "Tx");
        pdf_array_push(ctx, annots, noRect);
        pdf_array_push(ctx, fields, noRect);
        pdf_drop_obj(ctx, noRect);

        pdf_obj* noType = newAnnot(ctx, doc, "Widget", page);
        pdf_dict_put_text_string(ctx, noType, PDF_NAME(T), "noft");
        pdf_dict_put_rect(ctx, noType, PDF_NAME(Rect), fz_make_rect(50, 600, 150, 620));
        pdf_array_push(ctx, annots, noType);
        pdf_array_push(ctx, fields, noType);
        pdf_drop_obj(ctx, noType);

        pdf_obj* choice = newAnnot(ctx, doc, "Widget", page);
        pdf_dict_put_text_string(ctx, choice, PDF_NAME(T), "choice");
        pdf_dict_put_name(ctx, choice, PDF_NAME(FT), "Ch");
        pdf_dict_put_rect(ctx, choice, PDF_NAME(Rect), fz_make_rect(50, 500, 150, 520));
        pdf_array_push(ctx, annots, choice);
        pdf_array_push(ctx, fields, choice);
        pdf_drop_obj(ctx, choice);

        pdf_obj* note = newAnnot(ctx, doc, "Text", page);
        pdf_dict_put_text_string(ctx, note, PDF_NAME(Contents), "note");
        pdf_dict_put_rect(ctx, note, PDF_NAME(Rect), fz_make_rect(400, 400, 420, 420));
        pdf_array_push(ctx, annots, note);
        pdf_drop_obj(ctx, note);
    }

    /**
     * @brief Write a US Letter PDF with a grey box on every page.
     */
    static bool writeSamplePdf(const QString& filePath, int pageCount, bool withLegacyForm)
    {
        static const char kContent[] = "0.8 g 72 72 200 100 re f";

        fz_context* ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
        if (!ctx) {
            return false;
        }

        QByteArray pathUtf8 = filePath.toUtf8();
        pdf_document* doc = nullptr;
        fz_buffer* contents = nullptr;
        bool ok = true;
        fz_var(doc);
        fz_var(contents);
        fz_var(ok);

        fz_try(ctx) {
            doc = pdf_create_document(ctx);
            contents = fz_new_buffer_from_copied_data(
                ctx, reinterpret_cast<const unsigned char*>(kContent), strlen(kContent));

            for (int i = 0; i < pageCount; ++i) {
                pdf_obj* page = pdf_add_page(ctx, doc, fz_make_rect(0, 0, 612, 792), 0,
                                             nullptr, contents);
                pdf_insert_page(ctx, doc, -1, page);
                pdf_drop_obj(ctx, page);
            }

            if (withLegacyForm) {
                addLegacyForm(ctx, doc);
            }

            pdf_write_options opts = pdf_default_write_options;
            pdf_save_document(ctx, doc, pathUtf8.constData(), &opts);
        }
        fz_always(ctx) {
            fz_drop_buffer(ctx, contents);
            pdf_drop_document(ctx, doc);
        }
        fz_catch(ctx) {
            qWarning() << "[FormPdfTests] Failed to write sample:" << fz_caught_message(ctx);
            ok = false;
        }

        fz_drop_context(ctx);
        return ok;
    }

    /**
     * @brief Write a two-page PDF whose first page links to the second.
     *
     * Page 0 carries a /Link with /Dest [page1 /XYZ 0 792 0], a /Link with a
     * GoTo action to [page1 /Fit] and a text widget, so grafting a link
     * without remapping would pull in the source page tree.
     */
    static bool writeLinkedPdf(const QString& filePath)
    {
        if (!writeSamplePdf(filePath, 2, false)) {
            return false;
        }

        fz_context* ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
        if (!ctx) {
            return false;
        }

        QByteArray pathUtf8 = filePath.toUtf8();
        pdf_document* doc = nullptr;
        bool ok = true;
        fz_var(doc);
        fz_var(ok);

        fz_try(ctx) {
            doc = pdf_open_document(ctx, pathUtf8.constData());
            pdf_obj* first = pdf_lookup_page_obj(ctx, doc, 0);
            pdf_obj* second = pdf_lookup_page_obj(ctx, doc, 1);
            pdf_obj* annots = pdf_dict_put_array(ctx, first, PDF_NAME(Annots), 3);

            pdf_obj* destLink = newAnnot(ctx, doc, "Link", first);
            pdf_dict_put_rect(ctx, destLink, PDF_NAME(Rect), fz_make_rect(72, 72, 272, 172));
            pdf_obj* dest = pdf_dict_put_array(ctx, destLink, PDF_NAME(Dest), 5);
            pdf_array_push(ctx, dest, second);
            pdf_array_push(ctx, dest, PDF_NAME(XYZ));
            pdf_array_push_int(ctx, dest, 0);
            pdf_array_push_int(ctx, dest, 792);
            pdf_array_push_int(ctx, dest, 0);
            pdf_array_push(ctx, annots, destLink);
            pdf_drop_obj(ctx, destLink);

            pdf_obj* actionLink = newAnnot(ctx, doc, "Link", first);
            pdf_dict_put_rect(ctx, actionLink, PDF_NAME(Rect), fz_make_rect(72, 300, 272, 320));
            pdf_obj* action = pdf_dict_put_dict(ctx, actionLink, PDF_NAME(A), 2);
            pdf_dict_put(ctx, action, PDF_NAME(S), PDF_NAME(GoTo));
            pdf_obj* target = pdf_dict_put_array(ctx, action, PDF_NAME(D), 2);
            pdf_array_push(ctx, target, second);
            pdf_array_push(ctx, target, PDF_NAME(Fit));
            pdf_array_push(ctx, annots, actionLink);
            pdf_drop_obj(ctx, actionLink);

            pdf_obj* widget = newAnnot(ctx, doc, "Widget", first);
            pdf_dict_put_text_string(ctx, widget, PDF_NAME(T), "old");
            pdf_dict_put_name(ctx, widget, PDF_NAME(FT), "Tx");
            pdf_dict_put_rect(ctx, widget, PDF_NAME(Rect), fz_make_rect(50, 700, 250, 724));
            pdf_array_push(ctx, annots, widget);
            pdf_drop_obj(ctx, widget);

            pdf_write_options opts = pdf_default_write_options;
            pdf_save_document(ctx, doc, pathUtf8.constData(), &opts);
        }
        fz_always(ctx) {
            pdf_drop_document(ctx, doc);
        }
        fz_catch(ctx) {
            qWarning() << "[FormPdfTests] Failed to write linked sample:" << fz_caught_message(ctx);
            ok = false;
        }

        fz_drop_context(ctx);
        return ok;
    }

    /**
     * @brief Link targets and object census of a written PDF.
     */
    struct LinkSummary {
        bool readable = false;
        int links = 0;
        int destOnSecondPage = 0;      ///< /Dest arrays naming output page 1
        int actionOnSecondPage = 0;    ///< GoTo /D arrays naming output page 1
        int pageObjects = 0;           ///< /Type /Page objects in the xref
        int widgetObjects = 0;         ///< /Subtype /Widget objects in the xref
    };

    static LinkSummary inspectLinks(const QString& filePath)
    {
        LinkSummary summary;

        fz_context* ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
        if (!ctx) {
            return summary;
        }

        QByteArray pathUtf8 = filePath.toUtf8();
        pdf_document* doc = nullptr;
        fz_var(doc);

        fz_try(ctx) {
            doc = pdf_open_document(ctx, pathUtf8.constData());
            int secondPage = pdf_to_num(ctx, pdf_lookup_page_obj(ctx, doc, 1));

            pdf_obj* annots = pdf_dict_get(ctx, pdf_lookup_page_obj(ctx, doc, 0), PDF_NAME(Annots));
            for (int i = 0; i < pdf_array_len(ctx, annots); ++i) {
                pdf_obj* annot = pdf_array_get(ctx, annots, i);
                if (!pdf_name_eq(ctx, pdf_dict_get(ctx, annot, PDF_NAME(Subtype)), PDF_NAME(Link))) {
                    continue;
                }
                ++summary.links;

                pdf_obj* dest = pdf_array_get(ctx, pdf_dict_get(ctx, annot, PDF_NAME(Dest)), 0);
                if (dest && pdf_to_num(ctx, dest) == secondPage) {
                    ++summary.destOnSecondPage;
                }
                pdf_obj* action = pdf_dict_get(ctx, annot, PDF_NAME(A));
                pdf_obj* target = pdf_array_get(ctx, pdf_dict_get(ctx, action, PDF_NAME(D)), 0);
                if (target && pdf_to_num(ctx, target) == secondPage) {
                    ++summary.actionOnSecondPage;
                }
            }

            int xrefLen = pdf_xref_len(ctx, doc);
            for (int num = 1; num < xrefLen; ++num) {
                pdf_obj* ref = pdf_new_indirect(ctx, doc, num, 0);
                pdf_obj* obj = pdf_resolve_indirect(ctx, ref);
                if (pdf_is_dict(ctx, obj)) {
                    if (pdf_name_eq(ctx, pdf_dict_get(ctx, obj, PDF_NAME(Type)), PDF_NAME(Page))) {
                        ++summary.pageObjects;
                    }
                    if (pdf_name_eq(ctx, pdf_dict_get(ctx, obj, PDF_NAME(Subtype)), PDF_NAME(Widget))) {
                        ++summary.widgetObjects;
                    }
                }
                pdf_drop_obj(ctx, ref);
            }
            summary.readable = true;
        }
        fz_always(ctx) {
            pdf_drop_document(ctx, doc);
        }
        fz_catch(ctx) {
            qWarning() << "[FormPdfTests] Failed to inspect links:" << fz_caught_message(ctx);
            summary.readable = false;
        }

        fz_drop_context(ctx);
        return summary;
    }

    static QByteArray readAll(const QString& filePath)
    {
        QFile file(filePath);
        if (!file.open(QIODevice::ReadOnly)) {
            return QByteArray();
        }
        return file.readAll();
    }

    static bool writeBytes(const QString& filePath, const QByteArray& bytes)
    {
        QFile file(filePath);
        return file.open(QIODevice::WriteOnly) && file.write(bytes) == bytes.size();
    }

    static PdfFormSummary inspectPdf(const QString& filePath)
    {
        PdfFormSummary summary;

        fz_context* ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
        if (!ctx) {
            return summary;
        }

        QByteArray pathUtf8 = filePath.toUtf8();
        pdf_document* doc = nullptr;
        fz_var(doc);

        fz_try(ctx) {
            doc = pdf_open_document(ctx, pathUtf8.constData());
            summary.pageCount = pdf_count_pages(ctx, doc);

            for (int i = 0; i < summary.pageCount; ++i) {
                pdf_obj* page = pdf_lookup_page_obj(ctx, doc, i);
                pdf_obj* annots = pdf_dict_get(ctx, page, PDF_NAME(Annots));
                int widgets = 0;
                for (int j = 0; j < pdf_array_len(ctx, annots); ++j) {
                    pdf_obj* subtype = pdf_dict_get(ctx, pdf_array_get(ctx, annots, j),
                                                    PDF_NAME(Subtype));
                    if (pdf_name_eq(ctx, subtype, PDF_NAME(Widget))) {
                        ++widgets;
                    } else {
                        summary.otherAnnotations.append(
                            QString::fromUtf8(pdf_to_name(ctx, subtype)));
                    }
                }
                summary.widgetsPerPage.append(widgets);
            }

            pdf_obj* root = pdf_dict_get(ctx, pdf_trailer(ctx, doc), PDF_NAME(Root));
            pdf_obj* acroForm = pdf_dict_get(ctx, root, PDF_NAME(AcroForm));
            if (pdf_is_dict(ctx, acroForm)) {
                summary.acroFormFieldCount =
                    pdf_array_len(ctx, pdf_dict_get(ctx, acroForm, PDF_NAME(Fields)));
                summary.needAppearances =
                    pdf_to_bool(ctx, pdf_dict_get(ctx, acroForm, PDF_NAME(NeedAppearances)));
            }
            summary.readable = true;
        }
        fz_always(ctx) {
            pdf_drop_document(ctx, doc);
        }
        fz_catch(ctx) {
            qWarning() << "[FormPdfTests] Failed to inspect:" << fz_caught_message(ctx);
            summary.readable = false;
        }

        fz_drop_context(ctx);
        return summary;
    }

    static FormField makeField(FieldType type, int page, const QString& name,
                               qreal x, qreal y, qreal w, qreal h)
    {
        FormField field;
        field.type = type;
        field.page = page;
        field.name = name;
        field.x = x;
        field.y = y;
        field.width = w;
        field.height = h;
        return field;
    }

private slots:
    void initTestCase() {
        QVERIFY(m_dir.isValid());
        QVERIFY(writeSamplePdf(path("plain.pdf"), 2, false));
        QVERIFY(writeSamplePdf(path("legacy.pdf"), 2, true));
    }

    // ===== Import =====

    void testImportReadsLegacyForm() {
        FieldImportResult result = FormFieldImporter::importFields(path("legacy.pdf"));

        QVERIFY(result.success);
        QCOMPARE(result.errorKind, FormErrorKind::None);
        QCOMPARE(result.fields.size(), 2);
        QCOMPARE(result.skippedWidgets, 3);

        const FormField& text = result.fields.at(0);
        QCOMPARE(text.type, FieldType::Text);
        QCOMPARE(text.name, QString("legacy"));
        QCOMPARE(*text.page, 0);
        QVERIFY(text.required);
        QCOMPARE(text.defaultValue, QString("prefilled"));
        QCOMPARE(text.x, 50.0);
        QCOMPARE(text.y, 700.0);
        QCOMPARE(text.width, 200.0);
        QCOMPARE(text.height, 24.0);

        const FormField& box = result.fields.at(1);
        QCOMPARE(box.type, FieldType::Checkbox);
        QCOMPARE(box.name, QString("parentName"));
        QVERIFY(box.checked);
        QVERIFY(!box.required);
        QCOMPARE(box.x, 300.0);
        QCOMPARE(box.width, 18.0);
        QCOMPARE(box.height, 18.0);
    }

    void testImportPlainDocumentHasNoFields() {
        FieldImportResult result = FormFieldImporter::importFields(path("plain.pdf"));
        QVERIFY(result.success);
        QVERIFY(result.fields.isEmpty());
        QCOMPARE(result.skippedWidgets, 0);
    }

    void testImportFailsOnMissingFile() {
        FieldImportResult result = FormFieldImporter::importFields(path("missing.pdf"));
        QVERIFY(!result.success);
        QCOMPARE(result.errorKind, FormErrorKind::Import);
        QVERIFY(result.fields.isEmpty());
        QVERIFY(!result.errorMessage.isEmpty());
    }

    // ===== Write =====

    void testWriteWithoutFieldsStripsForm() {
        FormPdfWriter writer;
        FieldWriteOptions options;
        options.sourcePath = path("legacy.pdf");
        options.outputPath = path("stripped.pdf");

        FieldWriteResult result = writer.writeFields(options);
        QVERIFY(result.success);
        QCOMPARE(result.pagesWritten, 2);
        QCOMPARE(result.fieldsWritten, 0);
        QVERIFY(result.fileSizeBytes > 0);

        PdfFormSummary summary = inspectPdf(options.outputPath);
        QVERIFY(summary.readable);
        QCOMPARE(summary.pageCount, 2);
        QCOMPARE(summary.acroFormFieldCount, -1);
        QCOMPARE(summary.widgetsPerPage, QVector<int>({0, 0}));
        QCOMPARE(summary.otherAnnotations, QStringList({"Text"}));

        QVERIFY(!QFile::exists(FormPdfWriter::stagingPathFor(options.outputPath)));
    }

    void testWriteThenImportRestoresFields() {
        FormField text = makeField(FieldType::Text, 0, "text_1", 80, 688, 140, 24);
        text.defaultValue = "Hello";
        FormField on = makeField(FieldType::Checkbox, 1, "checkbox_1", 100, 100, 18, 18);
        on.checked = true;
        FormField off = makeField(FieldType::Checkbox, 1, "checkbox_2", 200, 100, 18, 18);

        FormPdfWriter writer;
        QSignalSpy complete(&writer, &FormPdfWriter::writeComplete);
        FieldWriteOptions options;
        options.sourcePath = path("plain.pdf");
        options.outputPath = path("roundtrip.pdf");
        options.fields = {text, on, off};

        FieldWriteResult result = writer.writeFields(options);
        QVERIFY(result.success);
        QCOMPARE(result.fieldsWritten, 3);
        QCOMPARE(complete.count(), 1);

        PdfFormSummary summary = inspectPdf(options.outputPath);
        QCOMPARE(summary.acroFormFieldCount, 3);
        QVERIFY(summary.needAppearances);
        QCOMPARE(summary.widgetsPerPage, QVector<int>({1, 2}));

        FieldImportResult imported = FormFieldImporter::importFields(options.outputPath);
        QVERIFY(imported.success);
        QCOMPARE(imported.fields.size(), 3);

        const FormField& t = imported.fields.at(0);
        QCOMPARE(t.type, FieldType::Text);
        QCOMPARE(t.name, QString("text_1"));
        QCOMPARE(*t.page, 0);
        QCOMPARE(t.rect(), QRectF(80, 688, 140, 24));
        QCOMPARE(t.defaultValue, QString("Hello"));

        QCOMPARE(imported.fields.at(1).name, QString("checkbox_1"));
        QCOMPARE(*imported.fields.at(1).page, 1);
        QVERIFY(imported.fields.at(1).checked);
        QCOMPARE(imported.fields.at(2).name, QString("checkbox_2"));
        QVERIFY(!imported.fields.at(2).checked);
        QCOMPARE(imported.fields.at(2).rect(), QRectF(200, 100, 18, 18));
    }

    void testWriteReplacesLegacyForm() {
        FormPdfWriter writer;
        FieldWriteOptions options;
        options.sourcePath = path("legacy.pdf");
        options.outputPath = path("replaced.pdf");
        options.fields = {makeField(FieldType::Text, 0, "fresh", 60, 60, 140, 24)};

        QVERIFY(writer.writeFields(options).success);

        PdfFormSummary summary = inspectPdf(options.outputPath);
        QCOMPARE(summary.acroFormFieldCount, 1);
        QCOMPARE(summary.widgetsPerPage, QVector<int>({1, 0}));
        QCOMPARE(summary.otherAnnotations, QStringList({"Text"}));

        FieldImportResult imported = FormFieldImporter::importFields(options.outputPath);
        QCOMPARE(imported.fields.size(), 1);
        QCOMPARE(imported.fields.at(0).name, QString("fresh"));
        QCOMPARE(imported.skippedWidgets, 0);
    }

    void testWriteOverSource() {
        const QString target = path("inplace.pdf");
        QVERIFY(writeSamplePdf(target, 1, false));

        FormPdfWriter writer;
        FieldWriteOptions options;
        options.sourcePath = target;
        options.outputPath = target;
        options.fields = {makeField(FieldType::Checkbox, 0, "agree", 72, 72, 18, 18)};

        QVERIFY(writer.writeFields(options).success);

        FieldImportResult imported = FormFieldImporter::importFields(target);
        QCOMPARE(imported.fields.size(), 1);
        QCOMPARE(imported.fields.at(0).type, FieldType::Checkbox);
        QVERIFY(!QFile::exists(FormPdfWriter::stagingPathFor(target)));
        QVERIFY(!QFile::exists(FormPdfWriter::backupPathFor(target)));
    }

    void testWriteKeepsInternalLinks() {
        QVERIFY(writeLinkedPdf(path("linked.pdf")));

        FormPdfWriter writer;
        FieldWriteOptions options;
        options.sourcePath = path("linked.pdf");
        options.outputPath = path("linked_form.pdf");
        options.fields = {makeField(FieldType::Checkbox, 1, "seen", 72, 72, 18, 18)};

        FieldWriteResult result = writer.writeFields(options);
        QVERIFY(result.success);
        QCOMPARE(result.pagesWritten, 2);

        LinkSummary links = inspectLinks(options.outputPath);
        QVERIFY(links.readable);
        QCOMPARE(links.links, 2);
        QCOMPARE(links.destOnSecondPage, 1);
        QCOMPARE(links.actionOnSecondPage, 1);
        QCOMPARE(links.pageObjects, 2);
        QCOMPARE(links.widgetObjects, 1);

        PdfFormSummary summary = inspectPdf(options.outputPath);
        QCOMPARE(summary.widgetsPerPage, QVector<int>({0, 1}));
        QCOMPARE(summary.otherAnnotations, QStringList({"Link", "Link"}));
    }

    void testReplaceWithStagedSwapsFile() {
        const QString target = path("swap_target.pdf");
        const QString staged = FormPdfWriter::stagingPathFor(target);
        QVERIFY(writeBytes(target, "old"));
        QVERIFY(writeBytes(staged, "new"));

        QString error;
        QVERIFY(FormPdfWriter::replaceWithStaged(staged, target, &error));
        QVERIFY(error.isEmpty());
        QCOMPARE(readAll(target), QByteArray("new"));
        QVERIFY(!QFile::exists(staged));
        QVERIFY(!QFile::exists(FormPdfWriter::backupPathFor(target)));
    }

    void testReplaceWithStagedKeepsTargetWhenMoveFails() {
        const QString target = path("keep_target.pdf");
        QVERIFY(writeBytes(target, "original"));

        // Nothing was staged, so the second rename fails after the backup step
        QString error;
        QVERIFY(!FormPdfWriter::replaceWithStaged(path("never_staged.part"), target, &error));
        QVERIFY(!error.isEmpty());
        QCOMPARE(readAll(target), QByteArray("original"));
        QVERIFY(!QFile::exists(FormPdfWriter::backupPathFor(target)));
    }

    void testWriteFailsForMissingSource() {
        FormPdfWriter writer;
        QSignalSpy failed(&writer, &FormPdfWriter::writeFailed);
        FieldWriteOptions options;
        options.sourcePath = path("missing.pdf");
        options.outputPath = path("never.pdf");

        FieldWriteResult result = writer.writeFields(options);
        QVERIFY(!result.success);
        QCOMPARE(result.errorKind, FormErrorKind::Write);
        QCOMPARE(failed.count(), 1);
        QVERIFY(!QFile::exists(options.outputPath));
        QVERIFY(!QFile::exists(FormPdfWriter::stagingPathFor(options.outputPath)));
    }

    void testWriteIntoMissingDirectoryFails() {
        FormPdfWriter writer;
        FieldWriteOptions options;
        options.sourcePath = path("plain.pdf");
        options.outputPath = path("no_such_dir/out.pdf");

        FieldWriteResult result = writer.writeFields(options);
        QVERIFY(!result.success);
        QCOMPARE(result.errorKind, FormErrorKind::Write);
        QVERIFY(!QDir(path("no_such_dir")).exists());
    }

    void testWriteRejectsInvalidFields() {
        FormPdfWriter writer;
        FieldWriteOptions options;
        options.sourcePath = path("plain.pdf");
        options.outputPath = path("invalid.pdf");

        options.fields = {makeField(FieldType::Text, 0, QString(), 80, 688, 140, 24)};
        FieldWriteResult unnamed = writer.writeFields(options);
        QVERIFY(!unnamed.success);
        QCOMPARE(unnamed.errorKind, FormErrorKind::Write);

        options.fields = {makeField(FieldType::Text, 5, "far", 80, 688, 140, 24)};
        FieldWriteResult badPage = writer.writeFields(options);
        QVERIFY(!badPage.success);

        QVERIFY(!QFile::exists(options.outputPath));
    }

    // ===== Widget synthesis =====

    void testSynthesizerBuildsWidgets() {
        fz_context* ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
        QVERIFY(ctx != nullptr);

        FormField text = makeField(FieldType::Text, 0, "city", 80, 688, 140, 24);
        text.defaultValue = "Oslo";
        FormField box = makeField(FieldType::Checkbox, 0, "agree", 300, 100, 18, 18);
        box.checked = true;
        const QMap<int, QRectF> mediaBoxes = {{0, QRectF(0, 0, 612, 792)}};

        int scratchAnnots = -1;
        QString textType;
        QString textName;
        QString textValue;
        QString boxType;
        QString boxState;
        QString boxValue;
        fz_rect textRect = fz_empty_rect;
        {
            AnnotationSynthesizer synthesizer(ctx);
            QVERIFY(synthesizer.synthesize({text, box}, mediaBoxes));
            QCOMPARE(synthesizer.pages().size(), 1);
            QCOMPARE(synthesizer.pages().at(0).pageIndex, 0);
            QCOMPARE(synthesizer.widgetCount(), 2);

            pdf_obj* scratchPage = pdf_lookup_page_obj(ctx, synthesizer.scratchDocument(), 0);
            scratchAnnots = pdf_array_len(ctx, pdf_dict_get(ctx, scratchPage, PDF_NAME(Annots)));

            pdf_obj* textWidget = synthesizer.pages().at(0).widgets.at(0);
            textType = QString::fromUtf8(pdf_to_name(ctx, pdf_dict_get(ctx, textWidget, PDF_NAME(FT))));
            textName = QString::fromUtf8(pdf_to_text_string(ctx, pdf_dict_get(ctx, textWidget, PDF_NAME(T))));
            textValue = QString::fromUtf8(pdf_to_text_string(ctx, pdf_dict_get(ctx, textWidget, PDF_NAME(V))));
            textRect = pdf_to_rect(ctx, pdf_dict_get(ctx, textWidget, PDF_NAME(Rect)));

            pdf_obj* boxWidget = synthesizer.pages().at(0).widgets.at(1);
            boxType = QString::fromUtf8(pdf_to_name(ctx, pdf_dict_get(ctx, boxWidget, PDF_NAME(FT))));
            boxState = QString::fromUtf8(pdf_to_name(ctx, pdf_dict_get(ctx, boxWidget, PDF_NAME(AS))));
            boxValue = QString::fromUtf8(pdf_to_name(ctx, pdf_dict_get(ctx, boxWidget, PDF_NAME(V))));
        }

        bool unnamedRejected = false;
        bool unnamedHasMessage = false;
        {
            AnnotationSynthesizer synthesizer(ctx);
            unnamedRejected = !synthesizer.synthesize(
                {makeField(FieldType::Text, 0, QString(), 80, 688, 140, 24)}, mediaBoxes);
            unnamedHasMessage = !synthesizer.errorMessage().isEmpty();
        }

        bool noMediaBoxRejected = false;
        {
            AnnotationSynthesizer synthesizer(ctx);
            noMediaBoxRejected = !synthesizer.synthesize(
                {makeField(FieldType::Text, 3, "far", 80, 688, 140, 24)}, mediaBoxes);
        }

        fz_drop_context(ctx);

        QCOMPARE(scratchAnnots, 2);
        QCOMPARE(textType, QString("Tx"));
        QCOMPARE(textName, QString("city"));
        QCOMPARE(textValue, QString("Oslo"));
        QCOMPARE(textRect.x0, 80.0f);
        QCOMPARE(textRect.y0, 688.0f);
        QCOMPARE(textRect.x1, 220.0f);
        QCOMPARE(textRect.y1, 712.0f);
        QCOMPARE(boxType, QString("Btn"));
        QCOMPARE(boxState, QString("Yes"));
        QCOMPARE(boxValue, QString("Yes"));
        QVERIFY(unnamedRejected);
        QVERIFY(unnamedHasMessage);
        QVERIFY(noMediaBoxRejected);
    }

    // ===== Document lifecycle =====

    void testFormDocumentLifecycle() {
        FormDocument document;
        QSignalSpy opened(&document, &FormDocument::documentOpened);
        QSignalSpy closed(&document, &FormDocument::documentClosed);

        DocumentOpenResult open = document.open(path("legacy.pdf"));
        QVERIFY(open.success);
        QCOMPARE(open.errorKind, FormErrorKind::None);
        QCOMPARE(open.pageCount, 2);
        QCOMPARE(open.importedFields, 2);
        QCOMPARE(opened.count(), 1);
        QVERIFY(document.isOpen());

        const QString workingCopy = document.workingCopyPath();
        QVERIFY(QFile::exists(workingCopy));
        QVERIFY(workingCopy != path("legacy.pdf"));

        QCOMPARE(document.pageMetrics(0).widthPt, 612.0);
        QCOMPARE(document.pageMetrics(0).heightPt, 792.0);
        QVERIFY(!document.renderPage(0, 1.0).isNull());
        QVERIFY(document.renderPage(7, 1.0).isNull());

        PageFieldList* second = document.session().pageFields(1);
        QVERIFY(second != nullptr);
        second->place(FieldType::Text, QPointF(100, 500));

        const QByteArray workingBytes = readAll(workingCopy);
        QVERIFY(!workingBytes.isEmpty());

        const QString output = path("lifecycle_form.pdf");
        FieldWriteResult written = document.exportTo(output);
        QVERIFY(written.success);
        QCOMPARE(written.fieldsWritten, 3);
        QVERIFY(document.isOpen());
        QVERIFY(!document.renderPage(1, 1.0).isNull());

        FieldImportResult imported = FormFieldImporter::importFields(output);
        QCOMPARE(imported.fields.size(), 3);
        QCOMPARE(imported.fields.at(2).name, QString("text_1"));

        // Exports leave the working copy alone
        QCOMPARE(readAll(workingCopy), workingBytes);

        document.close();
        QVERIFY(!document.isOpen());
        QCOMPARE(closed.count(), 1);
        QVERIFY(!QFile::exists(workingCopy));
        QCOMPARE(document.pageCount(), 0);
    }

    void testFormDocumentExportFailureKeepsDocumentOpen() {
        FormDocument document;
        QVERIFY(document.open(path("legacy.pdf")).success);
        const int fieldsBefore = document.session().fieldCount();
        const QString workingCopy = document.workingCopyPath();

        FieldWriteResult result = document.exportTo(path("no_such_dir/out.pdf"));
        QVERIFY(!result.success);
        QCOMPARE(result.errorKind, FormErrorKind::Write);
        QVERIFY(!result.errorMessage.isEmpty());

        QVERIFY(document.isOpen());
        QVERIFY(QFile::exists(workingCopy));
        QVERIFY(!document.renderPage(0, 1.0).isNull());
        QCOMPARE(document.session().fieldCount(), fieldsBefore);
        QCOMPARE(document.pageCount(), 2);

        // A later export to a good path still works
        FieldWriteResult retry = document.exportTo(path("after_failure.pdf"));
        QVERIFY(retry.success);
        QCOMPARE(retry.fieldsWritten, fieldsBefore);
    }

    void testFormDocumentOpenFailure() {
        FormDocument document;
        DocumentOpenResult open = document.open(path("missing.pdf"));
        QVERIFY(!open.success);
        QCOMPARE(open.errorKind, FormErrorKind::Load);
        QVERIFY(!document.isOpen());
        QCOMPARE(document.pageCount(), 0);
    }
};

#endif // FORMPDFTESTS_H
