#include "FieldPropertiesPanel.h"

#include "../core/FormField.h"

#include <QCheckBox>
#include <QFormLayout>
#include <QLabel>
#include <QLineEdit>
#include <QVBoxLayout>

FieldPropertiesPanel::FieldPropertiesPanel(QWidget* parent)
    : QWidget(parent)
{
    setupUi();
    setField(nullptr);
}

void FieldPropertiesPanel::setupUi()
{
    auto* mainLayout = new QVBoxLayout(this);
    mainLayout->setContentsMargins(8, 8, 8, 8);

    auto* title = new QLabel(tr("Field Properties"), this);
    QFont titleFont = title->font();
    titleFont.setBold(true);
    title->setFont(titleFont);
    mainLayout->addWidget(title);

    auto* form = new QFormLayout();
    form->setFieldGrowthPolicy(QFormLayout::AllNonFixedFieldsGrow);

    m_typeLabel = new QLabel(this);
    form->addRow(tr("Type:"), m_typeLabel);

    m_nameEdit = new QLineEdit(this);
    form->addRow(tr("Name:"), m_nameEdit);

    m_defaultValueLabel = new QLabel(tr("Default:"), this);
    m_defaultValueEdit = new QLineEdit(this);
    form->addRow(m_defaultValueLabel, m_defaultValueEdit);

    m_checkedBox = new QCheckBox(tr("Checked"), this);
    form->addRow(QString(), m_checkedBox);

    m_requiredBox = new QCheckBox(tr("Required"), this);
    m_requiredBox->setEnabled(false);
    m_requiredBox->setToolTip(tr("Read from the source PDF"));
    form->addRow(QString(), m_requiredBox);

    m_geometryLabel = new QLabel(this);
    m_geometryLabel->setTextInteractionFlags(Qt::TextSelectableByMouse);
    form->addRow(tr("Rect (pt):"), m_geometryLabel);

    mainLayout->addLayout(form);
    mainLayout->addStretch(1);

    connect(m_nameEdit, &QLineEdit::editingFinished, this, &FieldPropertiesPanel::commitName);
    connect(m_defaultValueEdit, &QLineEdit::textEdited, this, [this](const QString& text) {
        if (!m_updating) {
            emit defaultValueEdited(text);
        }
    });
    connect(m_checkedBox, &QCheckBox::toggled, this, [this](bool checked) {
        if (!m_updating) {
            emit checkedToggled(checked);
        }
    });
}

void FieldPropertiesPanel::setField(const FormField* field)
{
    m_updating = true;
    m_hasField = field != nullptr;

    if (!field) {
        m_shownName.clear();
        m_typeLabel->setText(tr("No field selected"));
        m_nameEdit->clear();
        m_defaultValueEdit->clear();
        m_checkedBox->setChecked(false);
        m_requiredBox->setChecked(false);
        m_geometryLabel->clear();

        m_nameEdit->setEnabled(false);
        m_defaultValueEdit->setEnabled(false);
        m_checkedBox->setEnabled(false);
        m_defaultValueLabel->setVisible(true);
        m_defaultValueEdit->setVisible(true);
        m_checkedBox->setVisible(true);
        m_updating = false;
        return;
    }

    m_typeLabel->setText(FormField::displayName(field->type));

    // Keep the cursor position while the user is typing
    if (!m_nameEdit->hasFocus() || m_shownName != field->name) {
        m_nameEdit->setText(field->name);
    }
    m_shownName = field->name;
    m_nameEdit->setEnabled(true);

    m_defaultValueLabel->setVisible(field->isText());
    m_defaultValueEdit->setVisible(field->isText());
    m_defaultValueEdit->setEnabled(field->isText());
    if (field->isText() && m_defaultValueEdit->text() != field->defaultValue) {
        m_defaultValueEdit->setText(field->defaultValue);
    }

    m_checkedBox->setVisible(field->isCheckbox());
    m_checkedBox->setEnabled(field->isCheckbox());
    m_checkedBox->setChecked(field->isCheckbox() && field->checked);

    m_requiredBox->setChecked(field->required);

    m_geometryLabel->setText(QStringLiteral("%1, %2  %3 x %4")
                                 .arg(field->x, 0, 'f', 1)
                                 .arg(field->y, 0, 'f', 1)
                                 .arg(field->width, 0, 'f', 1)
                                 .arg(field->height, 0, 'f', 1));

    m_updating = false;
}

void FieldPropertiesPanel::commitName()
{
    if (m_updating || !m_hasField) {
        return;
    }

    const QString name = m_nameEdit->text().trimmed();
    if (name.isEmpty()) {
        // Names are required; restore the current one
        m_nameEdit->setText(m_shownName);
        return;
    }
    if (name != m_shownName) {
        emit nameEdited(name);
    }
}
