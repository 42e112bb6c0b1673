#pragma once

// ============================================================================
// FormDocument - One open PDF being edited
// ============================================================================
// Owns everything tied to the open file:
//   - a scratch working copy of the PDF in a private temporary directory
//   - the PdfProvider reading that copy (page sizes, rasters)
//   - the DocumentSession with the fields
//
// The provider keeps the working copy open, so it is released while an
// export reads the copy and reopened afterwards, whether the export
// succeeded or not. Exports never modify the working copy.
// ============================================================================

#include "DocumentSession.h"
#include "FormErrors.h"
#include "PageMetrics.h"

#include "../pdf/FormPdfWriter.h"
#include "../pdf/PdfProvider.h"

#include <QImage>
#include <QObject>
#include <QString>
#include <memory>

class QTemporaryDir;

/**
 * @brief Result of opening a document.
 *
 * An import failure does not fail the open: success is true, errorKind is
 * Import and errorMessage describes what could not be read.
 */
struct DocumentOpenResult {
    bool success = false;
    FormErrorKind errorKind = FormErrorKind::None;
    QString errorMessage;
    int pageCount = 0;
    int importedFields = 0;
};

class FormDocument : public QObject {
    Q_OBJECT

public:
    explicit FormDocument(QObject* parent = nullptr);
    ~FormDocument() override;

    // ===== Lifecycle =====

    /**
     * @brief Open a PDF for editing.
     *
     * Closes the current document first. On LoadError nothing is open.
     */
    DocumentOpenResult open(const QString& pdfPath);

    /**
     * @brief Close the document, drop the fields and delete the working copy.
     */
    void close();

    bool isOpen() const { return m_provider != nullptr; }

    /**
     * @brief Release the provider's hold on the working copy.
     */
    void releaseProvider();

    /**
     * @brief Reopen the provider on the working copy.
     * @return false if the working copy can no longer be loaded.
     */
    bool reopenProvider();

    // ===== Accessors =====

    QString sourcePath() const { return m_sourcePath; }
    QString workingCopyPath() const { return m_workingCopyPath; }
    int pageCount() const { return m_session.pageCount(); }
    PageMetrics pageMetrics(int pageIndex) const { return m_session.pageMetrics(pageIndex); }

    DocumentSession& session() { return m_session; }
    const DocumentSession& session() const { return m_session; }

    // ===== Rendering =====

    /**
     * @brief Render a page at a zoom factor (1.0 = 72 dpi).
     * @return Null image on failure (RenderError).
     */
    QImage renderPage(int pageIndex, qreal zoom) const;

    // ===== Export =====

    /**
     * @brief Write all fields into a copy of the document at outputPath.
     *
     * Assigns missing names and resolves duplicate names first. The working
     * copy is left as it is; every export starts again from the original
     * pages plus the session's fields.
     */
    FieldWriteResult exportTo(const QString& outputPath);

signals:
    void documentOpened(const QString& path);
    void documentClosed();

private:
    void deleteScratch();

    QString m_sourcePath;
    QString m_workingCopyPath;
    std::unique_ptr<QTemporaryDir> m_scratchDir;
    std::unique_ptr<PdfProvider> m_provider;
    DocumentSession m_session;
};
