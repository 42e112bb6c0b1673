// ============================================================================
// FormCanvas - Implementation
// ============================================================================

#include "FormCanvas.h"

#include "../core/FieldInteraction.h"
#include "../core/FormField.h"
#include "../core/PageFieldList.h"

#include <QMouseEvent>
#include <QPainter>

static const QColor CANVAS_BACKGROUND(0xe9, 0xea, 0xee);
static const QColor FIELD_COLOR(0x15, 0x65, 0xc0);
static const QColor SELECTED_COLOR(0xc6, 0x28, 0x28);

FormCanvas::FormCanvas(FieldInteraction* interaction, QWidget* parent)
    : QWidget(parent)
    , m_interaction(interaction)
    , m_placeholder(tr("Open a PDF to begin"))
{
    setMinimumSize(MIN_WIDTH, MIN_HEIGHT);
    setMouseTracking(true);
    setFocusPolicy(Qt::StrongFocus);

    connect(m_interaction, &FieldInteraction::repaintNeeded, this, QOverload<>::of(&QWidget::update));
    connect(m_interaction, &FieldInteraction::fieldsChanged, this, QOverload<>::of(&QWidget::update));
}

void FormCanvas::setPagePixmap(const QPixmap& pixmap)
{
    m_pixmap = pixmap;
    // Large pages grow the canvas (scroll area); small ones keep the minimum
    resize(sizeHint());
    updateGeometry();
    update();
}

void FormCanvas::clearPage(const QString& placeholder)
{
    m_pixmap = QPixmap();
    m_pointerDown = false;
    if (!placeholder.isEmpty()) {
        m_placeholder = placeholder;
    }
    unsetCursor();
    resize(sizeHint());
    update();
}

QSize FormCanvas::sizeHint() const
{
    if (m_pixmap.isNull()) {
        return QSize(MIN_WIDTH, MIN_HEIGHT);
    }
    return m_pixmap.size().expandedTo(QSize(MIN_WIDTH, MIN_HEIGHT));
}

// ============================================================================
// Painting
// ============================================================================

void FormCanvas::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    painter.fillRect(rect(), CANVAS_BACKGROUND);

    if (m_pixmap.isNull()) {
        painter.setPen(palette().color(QPalette::WindowText));
        painter.drawText(rect(), Qt::AlignCenter, m_placeholder);
        return;
    }

    painter.drawPixmap(0, 0, m_pixmap);

    if (!m_interaction->hasPage()) {
        return;
    }

    const PageFieldList* fields = m_interaction->fields();
    const int selected = m_interaction->selectedIndex();
    for (int i = 0; i < fields->count(); ++i) {
        if (i != selected) {
            drawField(painter, fields->at(i), false);
        }
    }
    // Selection on top of everything else
    if (fields->isValidIndex(selected)) {
        drawField(painter, fields->at(selected), true);
    }
}

void FormCanvas::drawField(QPainter& painter, const FormField& field, bool selected) const
{
    const QRectF rectPx = m_interaction->mapper().fieldRectToPixels(field);
    const QColor color = selected ? SELECTED_COLOR : FIELD_COLOR;

    painter.setRenderHint(QPainter::Antialiasing, false);
    QColor fill = color;
    fill.setAlpha(28);
    painter.fillRect(rectPx, fill);
    painter.setPen(QPen(color, selected ? 2 : 1));
    painter.setBrush(Qt::NoBrush);
    painter.drawRect(rectPx);

    if (field.isCheckbox() && field.checked) {
        painter.setRenderHint(QPainter::Antialiasing, true);
        QRectF inner = rectPx.adjusted(rectPx.width() * 0.2, rectPx.height() * 0.2,
                                       -rectPx.width() * 0.2, -rectPx.height() * 0.2);
        painter.drawLine(inner.topLeft(), inner.bottomRight());
        painter.drawLine(inner.topRight(), inner.bottomLeft());
    } else if (field.isText() && rectPx.height() >= 10) {
        QFont font = painter.font();
        font.setPixelSize(qBound(8, int(rectPx.height() * 0.5), 14));
        painter.setFont(font);
        const QString label = field.defaultValue.isEmpty() ? field.name : field.defaultValue;
        painter.drawText(rectPx.adjusted(3, 0, -3, 0), Qt::AlignVCenter | Qt::AlignLeft, label);
    }

    if (selected) {
        painter.setRenderHint(QPainter::Antialiasing, false);
        painter.setPen(QPen(Qt::black, 1));
        painter.setBrush(Qt::white);
        painter.drawRect(FieldInteraction::resizeHandleRect(rectPx));
    }
}

// ============================================================================
// Mouse Input
// ============================================================================

void FormCanvas::mousePressEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton || m_pixmap.isNull()) {
        event->ignore();
        return;
    }

    setFocus(Qt::MouseFocusReason);
    m_pointerDown = true;
    m_interaction->pointerPress(event->position());
    event->accept();
}

void FormCanvas::mouseMoveEvent(QMouseEvent* event)
{
    if (m_pointerDown && (event->buttons() & Qt::LeftButton)) {
        m_interaction->pointerMove(event->position());
        event->accept();
        return;
    }
    updateCursor(event->position());
}

void FormCanvas::mouseReleaseEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton || !m_pointerDown) {
        event->ignore();
        return;
    }

    m_pointerDown = false;
    m_interaction->pointerRelease(event->position());
    updateCursor(event->position());
    event->accept();
}

void FormCanvas::updateCursor(const QPointF& pixelPos)
{
    if (!m_interaction->hasPage()) {
        unsetCursor();
        return;
    }
    if (m_interaction->placementType().has_value()) {
        setCursor(Qt::CrossCursor);
        return;
    }

    const FormField* selected = m_interaction->selectedField();
    if (selected) {
        QRectF handle = FieldInteraction::resizeHandleRect(
            m_interaction->mapper().fieldRectToPixels(*selected));
        if (handle.contains(pixelPos)) {
            setCursor(Qt::SizeFDiagCursor);
            return;
        }
    }
    if (m_interaction->fieldIndexAt(pixelPos) >= 0) {
        setCursor(Qt::SizeAllCursor);
    } else {
        unsetCursor();
    }
}
