#pragma once

// ============================================================================
// FieldPropertiesPanel - Attribute editor for the selected form field
// ============================================================================
// Shows the selected field's type, name, geometry and type-specific value
// (default text or checked state). Edits are reported through signals; the
// owner applies them to the PageFieldList. The required flag is shown
// read-only: it comes from imported PDFs and is not editable.
//
// Usage:
// 1. MainWindow docks the panel beside the canvas
// 2. On selection or geometry change: setField(field) (nullptr to clear)
// 3. Connect nameEdited / defaultValueEdited / checkedToggled
// ============================================================================

#include <QWidget>

class QCheckBox;
class QLabel;
class QLineEdit;
struct FormField;

class FieldPropertiesPanel : public QWidget {
    Q_OBJECT

public:
    explicit FieldPropertiesPanel(QWidget* parent = nullptr);
    ~FieldPropertiesPanel() override = default;

    /**
     * @brief Show a field, or clear and disable the panel with nullptr.
     *
     * Does not emit edit signals.
     */
    void setField(const FormField* field);

    bool hasField() const { return m_hasField; }

signals:
    /**
     * @brief Name edited (emitted on editing finished, never empty).
     */
    void nameEdited(const QString& name);

    void defaultValueEdited(const QString& value);
    void checkedToggled(bool checked);

private:
    void setupUi();
    void commitName();

    QLabel* m_typeLabel = nullptr;
    QLineEdit* m_nameEdit = nullptr;
    QLineEdit* m_defaultValueEdit = nullptr;
    QLabel* m_defaultValueLabel = nullptr;
    QCheckBox* m_checkedBox = nullptr;
    QCheckBox* m_requiredBox = nullptr;
    QLabel* m_geometryLabel = nullptr;

    QString m_shownName;        ///< Name last set from the model
    bool m_hasField = false;
    bool m_updating = false;    ///< Suppresses edit signals during setField()
};
