#include "FormToolbar.h"
#include <QHBoxLayout>
#include <QPainter>
#include <QPushButton>

FormToolbar::FormToolbar(QWidget *parent)
    : QWidget(parent)
{
    setupUi();
    connectSignals();
    setDocumentActionsEnabled(false);
    setSelectionActionsEnabled(false);
    setNavigationEnabled(false, false);
}

QPushButton* FormToolbar::addModeButton(const QString& text, const QString& toolTip)
{
    auto *button = new QPushButton(text, this);
    button->setCheckable(true);
    button->setToolTip(toolTip);
    m_toolGroup->addButton(button);
    return button;
}

void FormToolbar::setupUi()
{
    setFixedHeight(44);

    auto *mainLayout = new QHBoxLayout(this);
    mainLayout->setContentsMargins(4, 4, 4, 4);
    mainLayout->setSpacing(2);

    // === Document actions ===
    m_openButton = new QPushButton(tr("Open PDF"), this);
    m_openButton->setToolTip(tr("Open PDF (Ctrl+O)"));
    mainLayout->addWidget(m_openButton);

    m_saveButton = new QPushButton(tr("Save PDF"), this);
    m_saveButton->setToolTip(tr("Save PDF with fields (Ctrl+S)"));
    mainLayout->addWidget(m_saveButton);

    mainLayout->addSpacing(16);

    // === Mode buttons (exclusive selection) ===
    m_toolGroup = new QButtonGroup(this);
    m_toolGroup->setExclusive(true);

    m_pointerButton = addModeButton(tr("Pointer"), tr("Select, move and resize fields"));
    m_pointerButton->setChecked(true);  // Default mode
    mainLayout->addWidget(m_pointerButton);

    m_addTextButton = addModeButton(tr("Add Text"), tr("Click on the page to place a text field"));
    mainLayout->addWidget(m_addTextButton);

    m_addCheckboxButton = addModeButton(tr("Add Checkbox"), tr("Click on the page to place a checkbox"));
    mainLayout->addWidget(m_addCheckboxButton);

    mainLayout->addSpacing(16);

    // === Selection commands ===
    m_deleteButton = new QPushButton(tr("Delete"), this);
    m_deleteButton->setToolTip(tr("Delete selected field (Del)"));
    mainLayout->addWidget(m_deleteButton);

    m_duplicateButton = new QPushButton(tr("Duplicate"), this);
    m_duplicateButton->setToolTip(tr("Duplicate selected field (Ctrl+D)"));
    mainLayout->addWidget(m_duplicateButton);

    mainLayout->addSpacing(16);

    // === Page navigation ===
    m_prevButton = new QPushButton(tr("Previous"), this);
    m_prevButton->setToolTip(tr("Previous page (Page Up)"));
    mainLayout->addWidget(m_prevButton);

    m_nextButton = new QPushButton(tr("Next"), this);
    m_nextButton->setToolTip(tr("Next page (Page Down)"));
    mainLayout->addWidget(m_nextButton);

    mainLayout->addStretch(1);
}

void FormToolbar::connectSignals()
{
    connect(m_pointerButton, &QPushButton::clicked, this, [this]() {
        m_currentTool = ToolType::Pointer;
        emit toolSelected(ToolType::Pointer);
    });
    connect(m_addTextButton, &QPushButton::clicked, this, [this]() {
        m_currentTool = ToolType::AddText;
        emit toolSelected(ToolType::AddText);
    });
    connect(m_addCheckboxButton, &QPushButton::clicked, this, [this]() {
        m_currentTool = ToolType::AddCheckbox;
        emit toolSelected(ToolType::AddCheckbox);
    });

    connect(m_openButton, &QPushButton::clicked, this, &FormToolbar::openClicked);
    connect(m_saveButton, &QPushButton::clicked, this, &FormToolbar::saveClicked);
    connect(m_deleteButton, &QPushButton::clicked, this, &FormToolbar::deleteClicked);
    connect(m_duplicateButton, &QPushButton::clicked, this, &FormToolbar::duplicateClicked);
    connect(m_prevButton, &QPushButton::clicked, this, &FormToolbar::previousPageClicked);
    connect(m_nextButton, &QPushButton::clicked, this, &FormToolbar::nextPageClicked);
}

void FormToolbar::setCurrentTool(ToolType tool)
{
    // Block signals to avoid triggering toolSelected during external sync
    m_toolGroup->blockSignals(true);

    switch (tool) {
        case ToolType::Pointer:
            m_pointerButton->setChecked(true);
            break;
        case ToolType::AddText:
            m_addTextButton->setChecked(true);
            break;
        case ToolType::AddCheckbox:
            m_addCheckboxButton->setChecked(true);
            break;
    }
    m_currentTool = tool;

    m_toolGroup->blockSignals(false);
}

void FormToolbar::setDocumentActionsEnabled(bool enabled)
{
    m_saveButton->setEnabled(enabled);
    m_pointerButton->setEnabled(enabled);
    m_addTextButton->setEnabled(enabled);
    m_addCheckboxButton->setEnabled(enabled);
}

void FormToolbar::setSelectionActionsEnabled(bool enabled)
{
    m_deleteButton->setEnabled(enabled);
    m_duplicateButton->setEnabled(enabled);
}

void FormToolbar::setNavigationEnabled(bool canGoBack, bool canGoForward)
{
    m_prevButton->setEnabled(canGoBack);
    m_nextButton->setEnabled(canGoForward);
}

void FormToolbar::paintEvent(QPaintEvent *event)
{
    QWidget::paintEvent(event);

    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing, false);

    // Bottom border line
    painter.setPen(QPen(m_borderColor, 1));
    painter.drawLine(0, height() - 1, width(), height() - 1);
}
