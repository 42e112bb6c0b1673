#pragma once

// ============================================================================
// PdfProvider - Abstract interface for reading and rasterising PDF pages
// ============================================================================
// The editor only needs page geometry and a raster of each page to draw the
// form overlays on. Implementations:
//   - PopplerPdfProvider (desktop, glibc)
//   - MuPdfProvider      (musl / Alpine and other platforms without Poppler)
//
// Rasters are rendered WITHOUT annotations: existing widgets are imported
// into the editor and drawn as overlays, so the baked-in versions would only
// show up as stale duplicates underneath.
//
// Design: Uses simple Qt value types instead of backend-specific types.
// ============================================================================

#include <QString>
#include <QSizeF>
#include <QImage>
#include <memory>

/**
 * @brief Abstract interface for PDF document access.
 *
 * A provider holds the file open (Poppler and MuPDF both keep file handles
 * or mappings), so it must be destroyed before the file is rewritten.
 */
class PdfProvider {
public:
    virtual ~PdfProvider() = default;

    // ===== Document Info =====

    /**
     * @brief Check if the PDF was loaded successfully.
     * @return True if a valid, unlocked PDF with at least one page is loaded.
     */
    virtual bool isValid() const = 0;

    /**
     * @brief Check if the PDF is password-protected and locked.
     */
    virtual bool isLocked() const = 0;

    /**
     * @brief Get the total number of pages.
     * @return Page count, or 0 if invalid.
     */
    virtual int pageCount() const = 0;

    // ===== Page Info =====

    /**
     * @brief Get the size of a page in points (1/72 inch).
     * @param pageIndex 0-based page index.
     * @return Page size in points, or empty QSizeF if invalid.
     */
    virtual QSizeF pageSize(int pageIndex) const = 0;

    // ===== Rendering =====

    /**
     * @brief Render a page to a QImage, annotations hidden.
     * @param pageIndex 0-based page index.
     * @param dpi Resolution in dots per inch (72 * zoom).
     * @return Rendered image, or null QImage on error.
     */
    virtual QImage renderPageToImage(int pageIndex, qreal dpi) const = 0;

    // ===== Factory =====

    /**
     * @brief Create a PdfProvider for the given file.
     * @param pdfPath Path to the PDF file.
     * @return Provider instance, or nullptr if the file cannot be loaded.
     *
     * Selects the backend for the current platform.
     */
    static std::unique_ptr<PdfProvider> create(const QString& pdfPath);

    /**
     * @brief Name of the backend create() uses ("poppler" or "mupdf").
     */
    static QString backendName();
};
