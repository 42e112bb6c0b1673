#pragma once

// ============================================================================
// CoordinateMapper - Pixel space <-> PDF point space
// ============================================================================
// Pixel space: origin top-left, y grows downward, device pixels of the
//              rendered page bitmap (already scaled by the render zoom).
// Point space: origin bottom-left, y grows upward, PDF points, independent
//              of zoom.
//
// Scale factors are derived per axis from the rendered bitmap size and the
// page size in points, so rounding of the bitmap dimensions is absorbed.
// ============================================================================

#include "PageMetrics.h"

#include <QPointF>
#include <QRectF>
#include <QSizeF>

struct FormField;

class CoordinateMapper {
public:
    /**
     * @brief Identity mapper (no page loaded). isValid() returns false.
     */
    CoordinateMapper() = default;

    /**
     * @brief Mapper for a page rendered to a bitmap of the given size.
     * @param metrics Page size in points.
     * @param pixelSize Size of the rendered bitmap in device pixels.
     *
     * Falls back to identity scales when either size is degenerate.
     */
    CoordinateMapper(const PageMetrics& metrics, const QSizeF& pixelSize);

    bool isValid() const { return m_valid; }

    const PageMetrics& metrics() const { return m_metrics; }
    QSizeF pixelSize() const { return m_pixelSize; }

    qreal scaleX() const { return m_scaleX; }
    qreal scaleY() const { return m_scaleY; }

    // ===== Points =====

    QPointF pixelToPoint(const QPointF& px) const;
    QPointF pointToPixel(const QPointF& pt) const;

    // ===== Rectangles =====

    /**
     * @brief Convert a bottom-left anchored point rectangle to a top-left
     *        anchored pixel rectangle.
     */
    QRectF rectToPixels(qreal x, qreal y, qreal width, qreal height) const;
    QRectF fieldRectToPixels(const FormField& field) const;

    /**
     * @brief Convert a top-left anchored pixel rectangle back to point space.
     * @return QRectF whose x()/y() are the lower-left corner in points.
     */
    QRectF pixelRectToPoints(const QRectF& px) const;

    // ===== Deltas =====

    /**
     * @brief Convert a pixel displacement to a point displacement.
     *
     * Axis direction is not flipped: a positive pixel dy stays positive.
     * Used for resize gestures where the delta is applied to a size.
     */
    QSizeF pixelDeltaToPoints(const QPointF& delta) const;

    /**
     * @brief Convert a length in device pixels to points on each axis.
     */
    QSizeF pixelLengthToPoints(qreal pixels) const;

private:
    PageMetrics m_metrics;
    QSizeF m_pixelSize;
    qreal m_scaleX = 1.0;
    qreal m_scaleY = 1.0;
    bool m_valid = false;
};
