#pragma once

// ============================================================================
// MuPdfProvider - MuPDF implementation of PdfProvider
// ============================================================================
// Used where Poppler is not available or collides with MuPDF's OpenJPEG
// (musl libc builds). MuPDF is linked in any case for form export, so this
// backend adds no dependency.
// ============================================================================

#include "PdfProvider.h"

// Forward declarations for MuPDF types (avoid exposing mupdf headers)
struct fz_context;
struct fz_document;

/**
 * @brief PdfProvider implementation using MuPDF.
 */
class MuPdfProvider : public PdfProvider {
public:
    /**
     * @brief Construct a provider for the given PDF file.
     * @param pdfPath Path to the PDF file.
     *
     * Check isValid() after construction to verify the PDF loaded successfully.
     */
    explicit MuPdfProvider(const QString& pdfPath);

    /**
     * @brief Destructor - cleans up MuPDF resources.
     */
    ~MuPdfProvider() override;

    // Disable copy (MuPDF context is not copyable)
    MuPdfProvider(const MuPdfProvider&) = delete;
    MuPdfProvider& operator=(const MuPdfProvider&) = delete;

    // ===== Document Info =====
    bool isValid() const override;
    bool isLocked() const override;
    int pageCount() const override;

    // ===== Page Info =====
    QSizeF pageSize(int pageIndex) const override;

    // ===== Rendering =====
    QImage renderPageToImage(int pageIndex, qreal dpi) const override;

private:
    fz_context* m_ctx = nullptr;        ///< MuPDF context (owns all allocations)
    fz_document* m_doc = nullptr;       ///< The loaded PDF document
    QString m_path;                     ///< Path to the PDF file
    int m_pageCount = 0;                ///< Cached page count
};
