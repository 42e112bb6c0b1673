#pragma once

// ============================================================================
// FormField - A fillable form field placed on a PDF page
// ============================================================================
// Geometry is stored in PDF point space (origin bottom-left, y up), relative
// to the page the field belongs to. The field never stores pixels.
// ============================================================================

#include <QRectF>
#include <QString>
#include <optional>

/**
 * @brief Supported field types.
 *
 * Radio groups, dropdowns and signatures are not modelled.
 */
enum class FieldType {
    Text,
    Checkbox
};

/**
 * @brief A single form field.
 *
 * The page assignment is optional only between construction and the first
 * commit into a PageFieldList, which assigns its own page index.
 */
struct FormField {
    std::optional<int> page;   ///< Owning page (0-based), unset until committed
    QString name;              ///< PDF field name (/T), unique per document before export
    FieldType type = FieldType::Text;

    qreal x = 0.0;             ///< Lower-left x in points
    qreal y = 0.0;             ///< Lower-left y in points
    qreal width = 0.0;         ///< Width in points
    qreal height = 0.0;        ///< Height in points

    bool required = false;     ///< Imported from /Ff bit 2, not exported
    QString defaultValue;      ///< Text fields only
    bool checked = false;      ///< Checkboxes only

    /**
     * @brief Rectangle in point space, anchored at the lower-left corner.
     *
     * QRectF's "top" here is the lower y value; callers must not treat the
     * result as a screen rectangle.
     */
    QRectF rect() const { return QRectF(x, y, width, height); }

    bool isText() const { return type == FieldType::Text; }
    bool isCheckbox() const { return type == FieldType::Checkbox; }

    /**
     * @brief Default size for newly placed fields, in points.
     */
    static QSizeF defaultSize(FieldType type);

    /**
     * @brief Prefix used for generated names ("text" / "checkbox").
     */
    static QString typePrefix(FieldType type);

    /**
     * @brief Human readable type name for the UI.
     */
    static QString displayName(FieldType type);
};
