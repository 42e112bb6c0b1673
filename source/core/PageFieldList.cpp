// ============================================================================
// PageFieldList - Implementation
// ============================================================================

#include "PageFieldList.h"

#include <QtGlobal>
#include <algorithm>

PageFieldList::PageFieldList(int pageIndex, const PageMetrics& metrics)
    : m_pageIndex(pageIndex)
    , m_metrics(metrics)
{
}

void PageFieldList::clampIntoPage(FormField& field) const
{
    field.width = qBound<qreal>(0.0, field.width, m_metrics.widthPt);
    field.height = qBound<qreal>(0.0, field.height, m_metrics.heightPt);

    qreal maxX = qMax<qreal>(0.0, m_metrics.widthPt - field.width);
    qreal maxY = qMax<qreal>(0.0, m_metrics.heightPt - field.height);
    field.x = qBound<qreal>(0.0, field.x, maxX);
    field.y = qBound<qreal>(0.0, field.y, maxY);
}

int PageFieldList::append(FormField field)
{
    field.page = m_pageIndex;
    clampIntoPage(field);
    m_fields.append(std::move(field));
    return m_fields.size() - 1;
}

int PageFieldList::place(FieldType type, const QPointF& topLeftPt)
{
    QSizeF size = FormField::defaultSize(type);

    FormField field;
    field.type = type;
    field.width = size.width();
    field.height = size.height();
    field.x = topLeftPt.x();
    field.y = topLeftPt.y() - size.height();
    return append(std::move(field));
}

int PageFieldList::duplicate(int index, qreal offsetPt)
{
    if (!isValidIndex(index)) {
        return -1;
    }

    FormField copy = m_fields.at(index);
    copy.name.clear();
    copy.x += offsetPt;
    copy.y += offsetPt;
    return append(std::move(copy));
}

bool PageFieldList::moveTo(int index, qreal x, qreal y)
{
    if (!isValidIndex(index)) {
        return false;
    }
    FormField& field = m_fields[index];
    field.x = x;
    field.y = y;
    clampIntoPage(field);
    return true;
}

bool PageFieldList::resize(int index, qreal width, qreal height, const QSizeF& minimum)
{
    if (!isValidIndex(index)) {
        return false;
    }
    FormField& field = m_fields[index];

    qreal roomX = qMax<qreal>(0.0, m_metrics.widthPt - field.x);
    qreal roomY = qMax<qreal>(0.0, m_metrics.heightPt - field.y);

    if (field.isCheckbox()) {
        qreal minSide = qMax(minimum.width(), minimum.height());
        qreal side = std::max({width, height, minSide});
        // The page edge wins over the minimum
        side = qMin(side, qMin(roomX, roomY));
        field.width = side;
        field.height = side;
    } else {
        qreal w = qMax(minimum.width(), width);
        qreal h = qMax(minimum.height(), height);
        field.width = qMin(w, roomX);
        field.height = qMin(h, roomY);
    }
    return true;
}

bool PageFieldList::remove(int index)
{
    if (!isValidIndex(index)) {
        return false;
    }
    m_fields.removeAt(index);
    return true;
}

bool PageFieldList::setName(int index, const QString& name)
{
    if (!isValidIndex(index)) {
        return false;
    }
    m_fields[index].name = name;
    return true;
}

bool PageFieldList::setDefaultValue(int index, const QString& value)
{
    if (!isValidIndex(index) || !m_fields.at(index).isText()) {
        return false;
    }
    m_fields[index].defaultValue = value;
    return true;
}

bool PageFieldList::setChecked(int index, bool checked)
{
    if (!isValidIndex(index) || !m_fields.at(index).isCheckbox()) {
        return false;
    }
    m_fields[index].checked = checked;
    return true;
}
