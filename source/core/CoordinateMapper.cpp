// ============================================================================
// CoordinateMapper - Implementation
// ============================================================================

#include "CoordinateMapper.h"
#include "FormField.h"

CoordinateMapper::CoordinateMapper(const PageMetrics& metrics, const QSizeF& pixelSize)
    : m_metrics(metrics)
    , m_pixelSize(pixelSize)
{
    if (metrics.isValid() && pixelSize.width() > 0 && pixelSize.height() > 0) {
        m_scaleX = pixelSize.width() / metrics.widthPt;
        m_scaleY = pixelSize.height() / metrics.heightPt;
        m_valid = true;
    }
}

QPointF CoordinateMapper::pixelToPoint(const QPointF& px) const
{
    if (!m_valid) {
        return px;
    }
    return QPointF(px.x() / m_scaleX,
                   m_metrics.heightPt - px.y() / m_scaleY);
}

QPointF CoordinateMapper::pointToPixel(const QPointF& pt) const
{
    if (!m_valid) {
        return pt;
    }
    return QPointF(pt.x() * m_scaleX,
                   (m_metrics.heightPt - pt.y()) * m_scaleY);
}

QRectF CoordinateMapper::rectToPixels(qreal x, qreal y, qreal width, qreal height) const
{
    if (!m_valid) {
        return QRectF(x, y, width, height);
    }
    // Point rects hang off their bottom edge, pixel rects off their top edge
    qreal left = x * m_scaleX;
    qreal top = (m_metrics.heightPt - (y + height)) * m_scaleY;
    return QRectF(left, top, width * m_scaleX, height * m_scaleY);
}

QRectF CoordinateMapper::fieldRectToPixels(const FormField& field) const
{
    return rectToPixels(field.x, field.y, field.width, field.height);
}

QRectF CoordinateMapper::pixelRectToPoints(const QRectF& px) const
{
    if (!m_valid) {
        return px;
    }
    qreal width = px.width() / m_scaleX;
    qreal height = px.height() / m_scaleY;
    qreal x = px.left() / m_scaleX;
    qreal y = m_metrics.heightPt - px.bottom() / m_scaleY;
    return QRectF(x, y, width, height);
}

QSizeF CoordinateMapper::pixelDeltaToPoints(const QPointF& delta) const
{
    if (!m_valid) {
        return QSizeF(delta.x(), delta.y());
    }
    return QSizeF(delta.x() / m_scaleX, delta.y() / m_scaleY);
}

QSizeF CoordinateMapper::pixelLengthToPoints(qreal pixels) const
{
    // Guard against a collapsed axis so the minimum stays finite
    constexpr qreal kMinScale = 1e-9;
    return QSizeF(pixels / qMax(m_scaleX, kMinScale),
                  pixels / qMax(m_scaleY, kMinScale));
}
