#pragma once

// ============================================================================
// AnnotationSynthesizer - Builds PDF widget annotations for form fields
// ============================================================================
// Creates one /Widget annotation per FormField inside a scratch MuPDF
// document. Each page that carries fields gets a scratch page with the same
// MediaBox as the source page, and its widgets are listed in that page's
// /Annots. FormPdfWriter grafts the widgets from here into the output.
//
// Widgets carry no appearance streams and no visual hints (no /MK /BG or
// /MK /BC, zero border). The output AcroForm sets /NeedAppearances so the
// viewer draws them.
// ============================================================================

#include "../core/FormField.h"

#include <QMap>
#include <QRectF>
#include <QString>
#include <QVector>

// Forward declarations for MuPDF types (avoid exposing mupdf headers)
struct fz_context;
struct pdf_document;
struct pdf_obj;

/**
 * @brief Widgets synthesized for one page.
 *
 * All pdf_obj pointers are indirect references owned by the synthesizer.
 */
struct SynthesizedPage {
    int pageIndex = -1;             ///< Page index in the source document
    pdf_obj* page = nullptr;        ///< Scratch page object
    QVector<pdf_obj*> widgets;      ///< Widget annotations, field order
};

/**
 * @brief Synthesizes widget annotations into a scratch PDF document.
 *
 * The synthesizer borrows the MuPDF context and owns the scratch document.
 * It is single-use: call synthesize() once, read pages(), then destroy it
 * (after the widgets have been grafted elsewhere).
 */
class AnnotationSynthesizer {
public:
    explicit AnnotationSynthesizer(fz_context* ctx);
    ~AnnotationSynthesizer();

    AnnotationSynthesizer(const AnnotationSynthesizer&) = delete;
    AnnotationSynthesizer& operator=(const AnnotationSynthesizer&) = delete;

    /**
     * @brief Build widgets for all fields.
     * @param fields Fields with an assigned page and a non-empty name.
     * @param mediaBoxes MediaBox (in points) of every page that has fields.
     * @return True on success. On failure errorMessage() describes the problem.
     */
    bool synthesize(const QVector<FormField>& fields, const QMap<int, QRectF>& mediaBoxes);

    /**
     * @brief Synthesized pages, ordered by page index.
     */
    const QVector<SynthesizedPage>& pages() const { return m_pages; }

    /**
     * @brief Total number of widgets created.
     */
    int widgetCount() const;

    QString errorMessage() const { return m_errorMessage; }

    /**
     * @brief The scratch document (for inspection in tests).
     */
    pdf_document* scratchDocument() const { return m_scratch; }

private:
    pdf_obj* addScratchPage(const QRectF& mediaBox);
    pdf_obj* buildWidget(const FormField& field, pdf_obj* pageRef);
    void release();

    fz_context* m_ctx = nullptr;            ///< Borrowed
    pdf_document* m_scratch = nullptr;      ///< Owned
    QVector<SynthesizedPage> m_pages;
    QString m_errorMessage;
};
