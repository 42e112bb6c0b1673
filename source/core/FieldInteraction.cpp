// ============================================================================
// FieldInteraction - Implementation
// ============================================================================

#include "FieldInteraction.h"
#include "PageFieldList.h"

#include <QDebug>
#include <QRectF>

FieldInteraction::FieldInteraction(QObject* parent)
    : QObject(parent)
{
}

// ============================================================================
// Page binding
// ============================================================================

void FieldInteraction::setPage(PageFieldList* fields, const CoordinateMapper& mapper)
{
    m_fields = fields;
    m_mapper = mapper;
    endGesture();
    setSelection(-1);
    m_state = m_placementType ? State::Placing : State::Idle;
    emit repaintNeeded();
}

void FieldInteraction::clearPage()
{
    m_fields = nullptr;
    m_mapper = CoordinateMapper();
    endGesture();
    setSelection(-1);
    m_state = m_placementType ? State::Placing : State::Idle;
    emit repaintNeeded();
}

// ============================================================================
// Mode
// ============================================================================

void FieldInteraction::setPlacementType(std::optional<FieldType> type)
{
    m_placementType = type;
    endGesture();

    if (type) {
        // Placement starts from a clean slate so the next press creates
        setSelection(-1);
        m_state = State::Placing;
    } else {
        m_state = (m_selectedIndex >= 0) ? State::Selected : State::Idle;
    }
    emit repaintNeeded();
}

// ============================================================================
// Selection
// ============================================================================

const FormField* FieldInteraction::selectedField() const
{
    if (!m_fields || !m_fields->isValidIndex(m_selectedIndex)) {
        return nullptr;
    }
    return &m_fields->at(m_selectedIndex);
}

void FieldInteraction::select(int index)
{
    if (!m_fields || !m_fields->isValidIndex(index)) {
        index = -1;
    }
    endGesture();
    if (index >= 0) {
        // An explicit selection ends placement mode
        if (m_placementType) {
            m_placementType.reset();
            emit placementFinished();
        }
        m_state = State::Selected;
    } else {
        m_state = m_placementType ? State::Placing : State::Idle;
    }
    setSelection(index);
    emit repaintNeeded();
}

void FieldInteraction::setSelection(int index)
{
    if (m_selectedIndex == index) {
        return;
    }
    m_selectedIndex = index;
    emit selectionChanged(index);
}

int FieldInteraction::fieldIndexAt(const QPointF& pixelPos) const
{
    if (!m_fields) {
        return -1;
    }
    for (int i = m_fields->count() - 1; i >= 0; --i) {
        if (m_mapper.fieldRectToPixels(m_fields->at(i)).contains(pixelPos)) {
            return i;
        }
    }
    return -1;
}

QRectF FieldInteraction::resizeHandleRect(const QRectF& fieldRectPx)
{
    const qreal half = RESIZE_HANDLE_SIZE / 2.0;
    return QRectF(fieldRectPx.right() - half,
                  fieldRectPx.bottom() - half,
                  RESIZE_HANDLE_SIZE,
                  RESIZE_HANDLE_SIZE);
}

// ============================================================================
// Pointer input
// ============================================================================

void FieldInteraction::pointerPress(const QPointF& pixelPos)
{
    if (!hasPage()) {
        return;
    }

    if (m_state == State::Placing && m_placementType) {
        placeFieldAt(pixelPos);
        return;
    }

    // The handle of the current selection is painted on top of everything,
    // including the half that sticks out of the field
    if (const FormField* current = selectedField()) {
        QRectF rectPx = m_mapper.fieldRectToPixels(*current);
        if (resizeHandleRect(rectPx).contains(pixelPos)) {
            beginGesture(m_selectedIndex, pixelPos);
            return;
        }
    }

    int hit = fieldIndexAt(pixelPos);
    setSelection(hit);

    if (hit >= 0) {
        beginGesture(hit, pixelPos);
    } else {
        m_state = State::Idle;
    }
    emit repaintNeeded();
}

void FieldInteraction::pointerMove(const QPointF& pixelPos)
{
    if (!hasPage()) {
        return;
    }

    switch (m_state) {
        case State::Dragging:
            updateDrag(pixelPos);
            break;
        case State::Resizing:
            updateResize(pixelPos);
            break;
        default:
            break;
    }
}

void FieldInteraction::pointerRelease(const QPointF& pixelPos)
{
    Q_UNUSED(pixelPos);

    if (m_state == State::Dragging || m_state == State::Resizing) {
        m_state = (m_selectedIndex >= 0) ? State::Selected : State::Idle;
    }
    endGesture();
}

void FieldInteraction::placeFieldAt(const QPointF& pixelPos)
{
    const FieldType type = *m_placementType;
    QPointF topLeftPt = m_mapper.pixelToPoint(pixelPos);

    int index = m_fields->place(type, topLeftPt);

    qDebug() << "[FieldInteraction] Placed" << FormField::typePrefix(type)
             << "on page" << m_fields->pageIndex()
             << "at" << m_fields->at(index).rect();

    m_placementType.reset();
    m_state = State::Selected;
    setSelection(index);

    emit fieldsChanged();
    emit fieldCreated();
    emit placementFinished();
    emit repaintNeeded();
}

void FieldInteraction::beginGesture(int index, const QPointF& pixelPos)
{
    const FormField& field = m_fields->at(index);
    QRectF rectPx = m_mapper.fieldRectToPixels(field);

    if (resizeHandleRect(rectPx).contains(pixelPos)) {
        m_state = State::Resizing;
        m_resizeStartPx = pixelPos;
        m_resizeStartSize = QSizeF(field.width, field.height);
    } else {
        m_state = State::Dragging;
        m_grabOffsetPx = pixelPos - rectPx.topLeft();
    }
}

void FieldInteraction::updateDrag(const QPointF& pixelPos)
{
    if (!m_fields->isValidIndex(m_selectedIndex)) {
        return;
    }

    const FormField& field = m_fields->at(m_selectedIndex);
    const QSizeF pixelSize = m_mapper.pixelSize();

    QPointF topLeftPx = pixelPos - m_grabOffsetPx;
    qreal leftPx = qBound<qreal>(0.0, topLeftPx.x(), pixelSize.width());
    qreal topPx = qBound<qreal>(0.0, topLeftPx.y(), pixelSize.height());

    // The gesture tracks the top edge, storage keeps the bottom edge
    QPointF topLeftPt = m_mapper.pixelToPoint(QPointF(leftPx, topPx));
    m_fields->moveTo(m_selectedIndex, topLeftPt.x(), topLeftPt.y() - field.height);

    emit fieldsChanged();
    emit repaintNeeded();
}

void FieldInteraction::updateResize(const QPointF& pixelPos)
{
    if (!m_fields->isValidIndex(m_selectedIndex)) {
        return;
    }

    QSizeF deltaPt = m_mapper.pixelDeltaToPoints(pixelPos - m_resizeStartPx);
    QSizeF minimum = m_mapper.pixelLengthToPoints(MIN_FIELD_PIXELS);

    m_fields->resize(m_selectedIndex,
                     m_resizeStartSize.width() + deltaPt.width(),
                     m_resizeStartSize.height() + deltaPt.height(),
                     minimum);

    emit fieldsChanged();
    emit repaintNeeded();
}

void FieldInteraction::endGesture()
{
    m_grabOffsetPx = QPointF();
    m_resizeStartPx = QPointF();
    m_resizeStartSize = QSizeF();
}

// ============================================================================
// Commands
// ============================================================================

bool FieldInteraction::deleteSelected()
{
    if (!m_fields || !m_fields->isValidIndex(m_selectedIndex)) {
        return false;
    }

    m_fields->remove(m_selectedIndex);
    endGesture();
    m_state = m_placementType ? State::Placing : State::Idle;
    setSelection(-1);

    emit fieldsChanged();
    emit repaintNeeded();
    return true;
}

bool FieldInteraction::duplicateSelected()
{
    if (!m_fields || !m_fields->isValidIndex(m_selectedIndex)) {
        return false;
    }

    int copyIndex = m_fields->duplicate(m_selectedIndex, DUPLICATE_OFFSET_PT);
    if (copyIndex < 0) {
        return false;
    }

    endGesture();
    m_state = State::Selected;
    setSelection(copyIndex);

    emit fieldsChanged();
    emit repaintNeeded();
    return true;
}
