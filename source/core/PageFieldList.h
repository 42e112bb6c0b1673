#pragma once

// ============================================================================
// PageFieldList - The fields of one page, owned by a DocumentSession
// ============================================================================
// All mutations of a page's fields go through this class so the containment
// invariant (every field fully inside its page, in point space) is enforced
// in one place. The canvas and the interaction state machine hold a
// non-owning pointer to the list of the page on screen.
// ============================================================================

#include "FormField.h"
#include "PageMetrics.h"

#include <QPointF>
#include <QSizeF>
#include <QVector>

class PageFieldList {
public:
    PageFieldList(int pageIndex, const PageMetrics& metrics);

    int pageIndex() const { return m_pageIndex; }
    const PageMetrics& metrics() const { return m_metrics; }

    // ===== Read access =====

    int count() const { return m_fields.size(); }
    bool isEmpty() const { return m_fields.isEmpty(); }
    bool isValidIndex(int index) const { return index >= 0 && index < m_fields.size(); }

    /**
     * @brief Field at index (insertion order, later = on top).
     */
    const FormField& at(int index) const { return m_fields.at(index); }
    const QVector<FormField>& fields() const { return m_fields; }

    // ===== Creation =====

    /**
     * @brief Commit a field to this page.
     * @param field Field to add; its page is set to this list's page.
     * @return Index of the new field.
     *
     * Geometry is clamped into the page.
     */
    int append(FormField field);

    /**
     * @brief Create a field of default size whose top-left corner is at
     *        the given point-space position.
     * @return Index of the new field.
     */
    int place(FieldType type, const QPointF& topLeftPt);

    /**
     * @brief Copy a field, clear its name and offset it diagonally.
     * @param index Field to copy.
     * @param offsetPt Offset added to x and y (points), clamped in-page.
     * @return Index of the copy, or -1 if index is invalid.
     */
    int duplicate(int index, qreal offsetPt);

    // ===== Geometry =====

    /**
     * @brief Move a field so its lower-left corner is at (x, y), clamped.
     */
    bool moveTo(int index, qreal x, qreal y);

    /**
     * @brief Resize a field keeping its origin (x, y) fixed.
     * @param width Requested width in points.
     * @param height Requested height in points.
     * @param minimum Minimum width/height in points.
     *
     * Checkboxes stay square: the side is the larger requested dimension.
     * The result never extends past the page edge.
     */
    bool resize(int index, qreal width, qreal height, const QSizeF& minimum);

    // ===== Removal =====

    bool remove(int index);
    void clear() { m_fields.clear(); }

    // ===== Attributes =====

    bool setName(int index, const QString& name);
    bool setDefaultValue(int index, const QString& value);
    bool setChecked(int index, bool checked);

private:
    void clampIntoPage(FormField& field) const;

    int m_pageIndex;
    PageMetrics m_metrics;
    QVector<FormField> m_fields;
};
