#include "MainWindow.h"

#include "core/FieldInteraction.h"
#include "core/FormDocument.h"
#include "core/PageFieldList.h"
#include "ui/FieldPropertiesPanel.h"
#include "ui/FormToolbar.h"
#include "viewport/FormCanvas.h"

#include <QDebug>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QHBoxLayout>
#include <QLabel>
#include <QListWidget>
#include <QMessageBox>
#include <QScrollArea>
#include <QSettings>
#include <QShortcut>
#include <QSplitter>
#include <QStatusBar>
#include <QVBoxLayout>

/// How long transient status messages stay visible.
static constexpr int STATUS_TIMEOUT_MS = 6000;

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
{
    setWindowTitle(tr("PDF Form Builder"));
    resize(1200, 800);

    m_document = new FormDocument(this);
    m_interaction = new FieldInteraction(this);

    loadSettings();
    setupUi();
    setupShortcuts();

    connect(m_interaction, &FieldInteraction::fieldsChanged, this, &MainWindow::onFieldsChanged);
    connect(m_interaction, &FieldInteraction::selectionChanged, this, &MainWindow::onSelectionChanged);
    connect(m_interaction, &FieldInteraction::placementFinished, this, &MainWindow::onPlacementFinished);

    updateActions();
    updateStatus();
    statusBar()->showMessage(tr("Ready"));
}

MainWindow::~MainWindow()
{
    // Unbind before the session's field lists go away
    m_interaction->clearPage();
}

// ============================================================================
// Setup
// ============================================================================

void MainWindow::loadSettings()
{
    QSettings settings("PdfFormBuilder", "App");
    m_zoom = qBound(MIN_ZOOM, settings.value("renderZoom", DEFAULT_ZOOM).toDouble(), MAX_ZOOM);
    m_lastOpenDir = settings.value("lastOpenDir", QDir::homePath()).toString();
    m_lastSaveDir = settings.value("lastSaveDir", QDir::homePath()).toString();

    const QByteArray geometry = settings.value("window/geometry").toByteArray();
    if (!geometry.isEmpty()) {
        restoreGeometry(geometry);
    }
}

void MainWindow::saveWindowSettings()
{
    QSettings settings("PdfFormBuilder", "App");
    settings.setValue("window/geometry", saveGeometry());
}

void MainWindow::setupUi()
{
    auto *central = new QWidget(this);
    auto *mainLayout = new QVBoxLayout(central);
    mainLayout->setContentsMargins(0, 0, 0, 0);
    mainLayout->setSpacing(0);

    m_toolbar = new FormToolbar(central);
    mainLayout->addWidget(m_toolbar);

    auto *splitter = new QSplitter(Qt::Horizontal, central);

    m_pageList = new QListWidget(splitter);
    m_pageList->setMinimumWidth(140);
    splitter->addWidget(m_pageList);

    m_canvas = new FormCanvas(m_interaction);
    m_scrollArea = new QScrollArea(splitter);
    m_scrollArea->setWidget(m_canvas);
    m_scrollArea->setAlignment(Qt::AlignCenter);
    m_scrollArea->setBackgroundRole(QPalette::Dark);
    splitter->addWidget(m_scrollArea);

    m_propertiesPanel = new FieldPropertiesPanel(splitter);
    m_propertiesPanel->setMinimumWidth(220);
    splitter->addWidget(m_propertiesPanel);

    splitter->setStretchFactor(0, 1);
    splitter->setStretchFactor(1, 4);
    splitter->setStretchFactor(2, 1);
    mainLayout->addWidget(splitter, 1);

    setCentralWidget(central);

    m_statusLabel = new QLabel(this);
    statusBar()->addPermanentWidget(m_statusLabel);

    // Toolbar
    connect(m_toolbar, &FormToolbar::toolSelected, this, &MainWindow::onToolSelected);
    connect(m_toolbar, &FormToolbar::openClicked, this, &MainWindow::openPdf);
    connect(m_toolbar, &FormToolbar::saveClicked, this, &MainWindow::savePdf);
    connect(m_toolbar, &FormToolbar::deleteClicked, this, &MainWindow::deleteSelectedField);
    connect(m_toolbar, &FormToolbar::duplicateClicked, this, &MainWindow::duplicateSelectedField);
    connect(m_toolbar, &FormToolbar::previousPageClicked, this, &MainWindow::showPreviousPage);
    connect(m_toolbar, &FormToolbar::nextPageClicked, this, &MainWindow::showNextPage);

    connect(m_pageList, &QListWidget::currentRowChanged, this, &MainWindow::onPageRowChanged);

    // Property edits go through the page list so containment and type rules hold
    connect(m_propertiesPanel, &FieldPropertiesPanel::nameEdited, this, [this](const QString& name) {
        PageFieldList *fields = m_interaction->fields();
        int index = m_interaction->selectedIndex();
        if (!fields || !fields->setName(index, name)) {
            return;
        }
        int uses = 0;
        for (const FormField& field : m_document->session().allFields()) {
            if (field.name == name) {
                ++uses;
            }
        }
        if (uses > 1) {
            statusBar()->showMessage(
                tr("The name \"%1\" is already used; duplicates are renamed on save").arg(name),
                STATUS_TIMEOUT_MS);
        }
        refreshSelectionUi();
    });
    connect(m_propertiesPanel, &FieldPropertiesPanel::defaultValueEdited, this, [this](const QString& value) {
        PageFieldList *fields = m_interaction->fields();
        if (fields && fields->setDefaultValue(m_interaction->selectedIndex(), value)) {
            m_canvas->update();
        }
    });
    connect(m_propertiesPanel, &FieldPropertiesPanel::checkedToggled, this, [this](bool checked) {
        PageFieldList *fields = m_interaction->fields();
        if (fields && fields->setChecked(m_interaction->selectedIndex(), checked)) {
            m_canvas->update();
        }
    });
}

void MainWindow::setupShortcuts()
{
    QShortcut* openShortcut = new QShortcut(QKeySequence::Open, this);
    connect(openShortcut, &QShortcut::activated, this, &MainWindow::openPdf);

    QShortcut* saveShortcut = new QShortcut(QKeySequence::Save, this);
    connect(saveShortcut, &QShortcut::activated, this, &MainWindow::savePdf);

    QShortcut* prevShortcut = new QShortcut(QKeySequence(Qt::Key_PageUp), this);
    connect(prevShortcut, &QShortcut::activated, this, &MainWindow::showPreviousPage);

    QShortcut* nextShortcut = new QShortcut(QKeySequence(Qt::Key_PageDown), this);
    connect(nextShortcut, &QShortcut::activated, this, &MainWindow::showNextPage);

    // Field commands are bound to the canvas area so they never fire while
    // a property line edit has focus
    QShortcut* deleteShortcut = new QShortcut(QKeySequence::Delete, m_scrollArea);
    deleteShortcut->setContext(Qt::WidgetWithChildrenShortcut);
    connect(deleteShortcut, &QShortcut::activated, this, &MainWindow::deleteSelectedField);

    QShortcut* duplicateShortcut = new QShortcut(QKeySequence(Qt::CTRL | Qt::Key_D), m_scrollArea);
    duplicateShortcut->setContext(Qt::WidgetWithChildrenShortcut);
    connect(duplicateShortcut, &QShortcut::activated, this, &MainWindow::duplicateSelectedField);

    QShortcut* copyShortcut = new QShortcut(QKeySequence::Copy, m_scrollArea);
    copyShortcut->setContext(Qt::WidgetWithChildrenShortcut);
    connect(copyShortcut, &QShortcut::activated, this, &MainWindow::duplicateSelectedField);
}

// ============================================================================
// Document lifecycle
// ============================================================================

void MainWindow::openPdf()
{
    QString path = QFileDialog::getOpenFileName(this,
        tr("Open PDF"),
        m_lastOpenDir,
        tr("PDF Files (*.pdf)"));
    if (path.isEmpty()) {
        return; // User cancelled
    }

    m_lastOpenDir = QFileInfo(path).absolutePath();
    QSettings settings("PdfFormBuilder", "App");
    settings.setValue("lastOpenDir", m_lastOpenDir);

    openPdfFile(path);
}

bool MainWindow::openPdfFile(const QString& path)
{
    closeDocument();

    DocumentOpenResult result = m_document->open(path);
    if (!result.success) {
        QMessageBox::critical(this, tr("Open Failed"), result.errorMessage);
        updateActions();
        updateStatus();
        return false;
    }

    setWindowTitle(tr("%1 - PDF Form Builder").arg(QFileInfo(path).fileName()));
    populatePageList();
    updateActions();

    if (result.errorKind == FormErrorKind::Import) {
        statusBar()->showMessage(tr("Existing fields could not be imported: %1")
                                     .arg(result.errorMessage));
    } else {
        statusBar()->showMessage(tr("Loaded %1 (%n field(s) imported)", nullptr,
                                    result.importedFields).arg(path),
                                 STATUS_TIMEOUT_MS);
    }
    return true;
}

void MainWindow::closeDocument()
{
    m_interaction->clearPage();
    m_document->close();

    m_currentPageIndex = -1;
    m_pageList->blockSignals(true);
    m_pageList->clear();
    m_pageList->blockSignals(false);
    m_canvas->clearPage(tr("Open a PDF to begin"));
    m_propertiesPanel->setField(nullptr);
    setWindowTitle(tr("PDF Form Builder"));

    updateActions();
    updateStatus();
}

void MainWindow::savePdf()
{
    if (!m_document->isOpen()) {
        return;
    }

    QFileInfo source(m_document->sourcePath());
    QString defaultPath = QDir(m_lastSaveDir).filePath(source.completeBaseName() + "_form.pdf");

    QString outputPath = QFileDialog::getSaveFileName(this,
        tr("Save PDF with Fields"),
        defaultPath,
        tr("PDF Files (*.pdf)"));
    if (outputPath.isEmpty()) {
        return; // User cancelled
    }
    if (!outputPath.toLower().endsWith(".pdf")) {
        outputPath += ".pdf";
    }

    m_lastSaveDir = QFileInfo(outputPath).absolutePath();
    QSettings settings("PdfFormBuilder", "App");
    settings.setValue("lastSaveDir", m_lastSaveDir);

    FieldWriteResult result = m_document->exportTo(outputPath);

    // Names may have been assigned or deduplicated, and the provider was reopened
    renderCurrentPage();
    for (int i = 0; i < m_document->pageCount(); ++i) {
        updatePageListItem(i);
    }

    if (!result.success) {
        QMessageBox::critical(this, tr("Save Failed"), result.errorMessage);
        return;
    }

    statusBar()->showMessage(tr("Saved %n field(s) to %1", nullptr, result.fieldsWritten)
                                 .arg(outputPath),
                             STATUS_TIMEOUT_MS);
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    saveWindowSettings();
    closeDocument();
    QMainWindow::closeEvent(event);
}

// ============================================================================
// Pages
// ============================================================================

void MainWindow::populatePageList()
{
    m_pageList->blockSignals(true);
    m_pageList->clear();
    for (int i = 0; i < m_document->pageCount(); ++i) {
        m_pageList->addItem(QString());
        updatePageListItem(i);
    }
    m_pageList->blockSignals(false);

    if (m_document->pageCount() > 0) {
        m_pageList->setCurrentRow(0);
        // setCurrentRow does not emit when row 0 was already current before clear()
        if (m_currentPageIndex != 0) {
            setCurrentPage(0);
        }
    }
}

void MainWindow::updatePageListItem(int pageIndex)
{
    QListWidgetItem *item = m_pageList->item(pageIndex);
    if (!item) {
        return;
    }
    item->setText(tr("Page %1 (%2)")
                      .arg(pageIndex + 1)
                      .arg(m_document->session().fieldCount(pageIndex)));
}

void MainWindow::onPageRowChanged(int row)
{
    if (row < 0 || !m_document->isOpen()) {
        return;
    }
    setCurrentPage(row);
}

void MainWindow::setCurrentPage(int pageIndex)
{
    if (pageIndex < 0 || pageIndex >= m_document->pageCount()) {
        return;
    }
    m_currentPageIndex = pageIndex;
    renderCurrentPage();

    if (m_pageList->currentRow() != pageIndex) {
        m_pageList->blockSignals(true);
        m_pageList->setCurrentRow(pageIndex);
        m_pageList->blockSignals(false);
    }
    updateActions();
    updateStatus();
}

void MainWindow::renderCurrentPage()
{
    if (m_currentPageIndex < 0 || !m_document->isOpen()) {
        m_interaction->clearPage();
        m_canvas->clearPage(m_document->isOpen() ? QString() : tr("Open a PDF to begin"));
        return;
    }

    QImage image = m_document->renderPage(m_currentPageIndex, m_zoom);
    if (image.isNull()) {
        m_interaction->clearPage();
        m_canvas->clearPage(tr("Page %1 could not be rendered").arg(m_currentPageIndex + 1));
        QMessageBox::critical(this, tr("Render Failed"),
            tr("Failed to render page %1 of %2")
                .arg(m_currentPageIndex + 1)
                .arg(m_document->sourcePath()));
        return;
    }

    m_canvas->setPagePixmap(QPixmap::fromImage(image));

    const PageMetrics metrics = m_document->pageMetrics(m_currentPageIndex);
    m_interaction->setPage(m_document->session().pageFields(m_currentPageIndex),
                           CoordinateMapper(metrics, QSizeF(image.size())));
}

void MainWindow::showPreviousPage()
{
    if (m_document->isOpen() && m_currentPageIndex > 0) {
        setCurrentPage(m_currentPageIndex - 1);
    }
}

void MainWindow::showNextPage()
{
    if (m_document->isOpen() && m_currentPageIndex < m_document->pageCount() - 1) {
        setCurrentPage(m_currentPageIndex + 1);
    }
}

// ============================================================================
// Editing
// ============================================================================

void MainWindow::onToolSelected(ToolType tool)
{
    switch (tool) {
        case ToolType::Pointer:
            m_interaction->setPlacementType(std::nullopt);
            break;
        case ToolType::AddText:
            m_interaction->setPlacementType(FieldType::Text);
            break;
        case ToolType::AddCheckbox:
            m_interaction->setPlacementType(FieldType::Checkbox);
            break;
    }
    updateStatus();
}

void MainWindow::onPlacementFinished()
{
    m_toolbar->setCurrentTool(ToolType::Pointer);
    updateStatus();
}

void MainWindow::onFieldsChanged()
{
    m_document->session().assignMissingNames();
    updatePageListItem(m_currentPageIndex);
    refreshSelectionUi();
    updateStatus();
}

void MainWindow::onSelectionChanged(int index)
{
    Q_UNUSED(index);
    refreshSelectionUi();
    updateActions();
}

void MainWindow::refreshSelectionUi()
{
    m_propertiesPanel->setField(m_interaction->selectedField());
    m_canvas->update();
}

void MainWindow::deleteSelectedField()
{
    if (!m_interaction->deleteSelected()) {
        statusBar()->showMessage(tr("No field selected"), STATUS_TIMEOUT_MS);
    }
}

void MainWindow::duplicateSelectedField()
{
    if (!m_interaction->duplicateSelected()) {
        statusBar()->showMessage(tr("No field selected"), STATUS_TIMEOUT_MS);
    }
}

// ============================================================================
// Status
// ============================================================================

QString MainWindow::modeDisplayName() const
{
    std::optional<FieldType> placement = m_interaction->placementType();
    if (!placement) {
        return tr("Pointer");
    }
    return *placement == FieldType::Text ? tr("Add Text") : tr("Add Checkbox");
}

void MainWindow::updateStatus()
{
    if (!m_document->isOpen() || m_currentPageIndex < 0) {
        m_statusLabel->setText(tr("No document"));
        return;
    }
    m_statusLabel->setText(tr("Page %1/%2 | Fields: %3 | Mode: %4")
                               .arg(m_currentPageIndex + 1)
                               .arg(m_document->pageCount())
                               .arg(m_document->session().fieldCount(m_currentPageIndex))
                               .arg(modeDisplayName()));
}

void MainWindow::updateActions()
{
    const bool open = m_document->isOpen();
    m_toolbar->setDocumentActionsEnabled(open);
    m_toolbar->setSelectionActionsEnabled(open && m_interaction->selectedIndex() >= 0);
    m_toolbar->setNavigationEnabled(open && m_currentPageIndex > 0,
                                    open && m_currentPageIndex < m_document->pageCount() - 1);
    if (!open) {
        m_toolbar->setCurrentTool(ToolType::Pointer);
        m_interaction->setPlacementType(std::nullopt);
    }
}
