// ============================================================================
// PdfProviderFactory - Platform-specific PDF provider creation
// ============================================================================
// Selects the rendering backend for the target platform:
//   - Alpine Linux (musl): MuPDF (avoids symbol collision with Poppler/OpenJPEG)
//   - Desktop (glibc, Windows, macOS): Poppler
// ============================================================================

#include "PdfProvider.h"

#include <QDebug>
#include <QFileInfo>
#include <memory>

// ============================================================================
// Platform Detection
// ============================================================================
// On musl libc both MuPDF and Poppler use OpenJPEG for JPEG2000. When both are
// loaded as shared libraries, MuPDF's custom allocators get called by
// Poppler's OpenJPEG, causing crashes. musl doesn't define __GLIBC__.
// The build can force MuPDF everywhere with -DFORMBUILDER_MUPDF_ONLY=ON.
// ============================================================================

#if !defined(FORMBUILDER_USE_MUPDF_RENDERER) && defined(__linux__) && !defined(__GLIBC__)
    #define FORMBUILDER_USE_MUPDF_RENDERER 1
#endif
#ifndef FORMBUILDER_USE_MUPDF_RENDERER
    #define FORMBUILDER_USE_POPPLER_RENDERER 1
#endif

#ifdef FORMBUILDER_USE_MUPDF_RENDERER
#include "MuPdfProvider.h"
using PdfProviderImpl = MuPdfProvider;
#else
#include "PopplerPdfProvider.h"
using PdfProviderImpl = PopplerPdfProvider;
#endif

// ============================================================================
// Factory Methods
// ============================================================================

std::unique_ptr<PdfProvider> PdfProvider::create(const QString& pdfPath)
{
    if (!QFileInfo::exists(pdfPath)) {
        qWarning() << "[PdfProvider] File not found:" << pdfPath;
        return nullptr;
    }

    auto provider = std::make_unique<PdfProviderImpl>(pdfPath);
    if (provider->isValid()) {
        return provider;
    }
    qWarning() << "[PdfProvider] Unusable PDF (locked:" << provider->isLocked() << "):" << pdfPath;
    return nullptr;
}

QString PdfProvider::backendName()
{
#ifdef FORMBUILDER_USE_MUPDF_RENDERER
    return QStringLiteral("mupdf");
#else
    return QStringLiteral("poppler");
#endif
}
