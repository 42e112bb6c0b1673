#pragma once

// ============================================================================
// FormPdfWriter - Writes form fields into a copy of a PDF using MuPDF
// ============================================================================
// Merge pipeline, run once per export:
//   1. Graft every source page into a fresh output document
//   2. Strip existing /Widget annotations and the /AcroForm dictionary
//   3. Synthesize widgets (AnnotationSynthesizer) and graft them in
//   4. Rebuild /AcroForm with /NeedAppearances and a Helv/ZaDb /DR
//   5. Save to a staging file beside the output, then swap it into place
//      through a backup so the previous output survives a failed move
//
// Page content and resources pass through unchanged. Non-widget annotations
// are kept, with link destinations pointed at the output pages.
// ============================================================================

#include "../core/FormErrors.h"
#include "../core/FormField.h"

#include <QHash>
#include <QObject>
#include <QString>
#include <QVector>

// Forward declarations for MuPDF types (avoid exposing mupdf headers in public API)
struct fz_context;
struct pdf_document;
struct pdf_graft_map;
struct pdf_obj;

/**
 * @brief Options for a form write.
 */
struct FieldWriteOptions {
    QString sourcePath;             ///< PDF whose pages are copied
    QString outputPath;             ///< Destination PDF (may equal sourcePath)
    QVector<FormField> fields;      ///< Fields to embed, all named and paged
};

/**
 * @brief Result of a form write.
 */
struct FieldWriteResult {
    bool success = false;
    FormErrorKind errorKind = FormErrorKind::None;
    QString errorMessage;
    int pagesWritten = 0;
    int fieldsWritten = 0;
    qint64 fileSizeBytes = 0;
};

/**
 * @brief Merges form widgets into a PDF.
 *
 * Thread Safety: Not thread-safe. One write at a time per instance.
 *
 * Usage:
 * @code
 * FormPdfWriter writer;
 * FieldWriteOptions options;
 * options.sourcePath = workingCopy;
 * options.outputPath = "/path/to/form.pdf";
 * options.fields = session.allFields();
 *
 * FieldWriteResult result = writer.writeFields(options);
 * if (!result.success) {
 *     qWarning() << "Write failed:" << result.errorMessage;
 * }
 * @endcode
 */
class FormPdfWriter : public QObject {
    Q_OBJECT

public:
    explicit FormPdfWriter(QObject* parent = nullptr);
    ~FormPdfWriter() override;

    FormPdfWriter(const FormPdfWriter&) = delete;
    FormPdfWriter& operator=(const FormPdfWriter&) = delete;

    /**
     * @brief Write the fields into a copy of the source PDF.
     * @return Result with success status. On failure nothing is left at
     *         outputPath that was not there before.
     *
     * Blocking.
     */
    FieldWriteResult writeFields(const FieldWriteOptions& options);

    /**
     * @brief Staging path used for an output path.
     *
     * Lives in the output's directory so the final move is a rename.
     */
    static QString stagingPathFor(const QString& outputPath);

    /**
     * @brief Backup path the previous output is parked at during the move.
     */
    static QString backupPathFor(const QString& outputPath);

    /**
     * @brief Move a staged file over outputPath.
     * @param errorMessage Set on failure (may be nullptr).
     * @return True on success. On failure the staged file is deleted and
     *         whatever was at outputPath before is still there.
     */
    static bool replaceWithStaged(const QString& stagingPath, const QString& outputPath,
                                  QString* errorMessage);

signals:
    void writeComplete(const QString& outputPath);
    void writeFailed(const QString& errorMessage);

private:
    bool initContext();
    bool openSource(const QString& sourcePath);
    bool graftPages();
    void graftPageAnnotations(pdf_graft_map* graftMap, int pageIndex,
                              const QHash<int, int>& pageMap);
    void relinkDestinations(pdf_graft_map* graftMap, pdf_obj* srcAnnot, pdf_obj* dstAnnot,
                            const QHash<int, int>& pageMap);
    pdf_obj* mapDestination(pdf_graft_map* graftMap, pdf_obj* dest,
                            const QHash<int, int>& pageMap);
    bool stripExistingForm();
    bool transplantWidgets(const QVector<FormField>& fields, int& fieldsWritten);
    bool saveDocument(const QString& path);
    void cleanup();

    FieldWriteResult fail(FieldWriteResult result, const QString& message);

    fz_context* m_ctx = nullptr;
    pdf_document* m_sourcePdf = nullptr;    ///< Opened source
    pdf_document* m_outputDoc = nullptr;    ///< Document being written
    QString m_stepError;                    ///< Detail of the last failed step
};
