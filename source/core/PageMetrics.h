#pragma once

// ============================================================================
// PageMetrics - Page dimensions in PDF points
// ============================================================================

#include <QSizeF>

/**
 * @brief Width and height of one page in points (1/72 inch).
 *
 * Sourced from the document provider when a document is opened and never
 * changed afterwards.
 */
struct PageMetrics {
    qreal widthPt = 0.0;
    qreal heightPt = 0.0;

    PageMetrics() = default;
    PageMetrics(qreal w, qreal h) : widthPt(w), heightPt(h) {}

    static PageMetrics fromSize(const QSizeF& size) {
        return PageMetrics(size.width(), size.height());
    }

    bool isValid() const { return widthPt > 0.0 && heightPt > 0.0; }
    QSizeF size() const { return QSizeF(widthPt, heightPt); }
};
