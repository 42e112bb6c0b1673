#pragma once

// ============================================================================
// FieldInteraction - Pointer-driven editing of one page's form fields
// ============================================================================
// State machine behind the form canvas. It receives pointer positions in
// pixel space (the rendered page bitmap's coordinates), converts them with a
// CoordinateMapper and mutates the bound PageFieldList.
//
//   Idle ──setPlacementType──> Placing ──press──> Selected
//    ^ │                                            │ ^
//    │ └──press on field──> Dragging / Resizing <───┘ │
//    └──────────── press on empty area ───── release ─┘
//
// The widget owns the painting; this class owns every decision about which
// field is hit, selected, moved or resized.
// ============================================================================

#include "CoordinateMapper.h"
#include "FormField.h"

#include <QObject>
#include <QPointF>
#include <QSizeF>
#include <optional>

class PageFieldList;

class FieldInteraction : public QObject {
    Q_OBJECT

public:
    enum class State {
        Idle,       ///< Nothing selected
        Placing,    ///< Next press creates a field of placementType()
        Selected,   ///< A field is selected, no gesture in progress
        Dragging,   ///< Moving the selected field
        Resizing    ///< Resizing the selected field from its bottom-right handle
    };

    static constexpr qreal RESIZE_HANDLE_SIZE = 10.0;   ///< Handle edge in device pixels
    static constexpr qreal MIN_FIELD_PIXELS = 7.0;      ///< Smallest resize in device pixels
    static constexpr qreal DUPLICATE_OFFSET_PT = 12.0;  ///< Diagonal offset of duplicates

    explicit FieldInteraction(QObject* parent = nullptr);

    // ===== Page binding =====

    /**
     * @brief Bind the page being edited.
     * @param fields Field list of the page (not owned, must outlive the binding).
     * @param mapper Mapper for the page's rendered bitmap.
     *
     * Clears selection and any gesture. Placement mode is kept.
     */
    void setPage(PageFieldList* fields, const CoordinateMapper& mapper);

    /**
     * @brief Unbind the page (document closed). All pointer input is ignored.
     */
    void clearPage();

    bool hasPage() const { return m_fields != nullptr && m_mapper.isValid(); }
    PageFieldList* fields() const { return m_fields; }
    const CoordinateMapper& mapper() const { return m_mapper; }

    // ===== Mode =====

    /**
     * @brief Enter placement mode for a type, or leave it with std::nullopt.
     */
    void setPlacementType(std::optional<FieldType> type);
    std::optional<FieldType> placementType() const { return m_placementType; }

    State state() const { return m_state; }

    // ===== Selection =====

    /**
     * @brief Selected field index, or -1.
     */
    int selectedIndex() const { return m_selectedIndex; }
    const FormField* selectedField() const;

    /**
     * @brief Select a field programmatically (-1 clears).
     */
    void select(int index);

    /**
     * @brief Topmost field under a pixel position, or -1.
     *
     * Later fields are on top.
     */
    int fieldIndexAt(const QPointF& pixelPos) const;

    /**
     * @brief Pixel rectangle of the resize handle for a field's pixel rect.
     */
    static QRectF resizeHandleRect(const QRectF& fieldRectPx);

    // ===== Pointer input (pixel space) =====

    void pointerPress(const QPointF& pixelPos);
    void pointerMove(const QPointF& pixelPos);
    void pointerRelease(const QPointF& pixelPos);

    // ===== Commands =====

    /**
     * @brief Delete the selected field.
     * @return false if nothing was selected.
     */
    bool deleteSelected();

    /**
     * @brief Duplicate the selected field and select the copy.
     * @return false if nothing was selected.
     */
    bool duplicateSelected();

signals:
    /**
     * @brief A field was created, moved, resized, deleted or duplicated.
     */
    void fieldsChanged();

    /**
     * @brief Selection changed. @p index is -1 when the selection is cleared.
     */
    void selectionChanged(int index);

    /**
     * @brief A field was placed from placement mode.
     */
    void fieldCreated();

    /**
     * @brief Placement mode ended automatically after a field was placed.
     */
    void placementFinished();

    /**
     * @brief Visual state changed (selection, geometry or handle).
     */
    void repaintNeeded();

private:
    void placeFieldAt(const QPointF& pixelPos);
    void beginGesture(int index, const QPointF& pixelPos);
    void updateDrag(const QPointF& pixelPos);
    void updateResize(const QPointF& pixelPos);
    void endGesture();
    void setSelection(int index);

    PageFieldList* m_fields = nullptr;      ///< Not owned
    CoordinateMapper m_mapper;

    State m_state = State::Idle;
    std::optional<FieldType> m_placementType;
    int m_selectedIndex = -1;

    // Gesture capture
    QPointF m_grabOffsetPx;                 ///< Pointer - rect top-left at drag start
    QPointF m_resizeStartPx;                ///< Pointer position at resize start
    QSizeF m_resizeStartSize;               ///< Field size (points) at resize start
};
