#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QCloseEvent>
#include <QString>

#include "core/ToolType.h"

class FieldInteraction;
class FieldPropertiesPanel;
class FormCanvas;
class FormDocument;
class FormToolbar;
class QLabel;
class QListWidget;
class QScrollArea;

/**
 * MainWindow - Form editor shell.
 *
 * Layout:
 *   [FormToolbar                                        ]
 *   [Page list | Canvas (scroll area)    | Properties   ]
 *   [Status bar: messages            page | fields | mode]
 *
 * Owns the open FormDocument and the FieldInteraction bound to the page
 * being shown.
 */
class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    static constexpr qreal DEFAULT_ZOOM = 1.25;
    static constexpr qreal MIN_ZOOM = 0.5;
    static constexpr qreal MAX_ZOOM = 4.0;

    explicit MainWindow(QWidget *parent = nullptr);
    ~MainWindow() override;

    /**
     * @brief Open a PDF by path (also used for a file given on the command line).
     * @return true if the document opened.
     */
    bool openPdfFile(const QString& path);

    int currentPageIndex() const { return m_currentPageIndex; }

public slots:
    void openPdf();
    void savePdf();
    void showPreviousPage();
    void showNextPage();
    void deleteSelectedField();
    void duplicateSelectedField();

protected:
    void closeEvent(QCloseEvent *event) override;

private slots:
    void onToolSelected(ToolType tool);
    void onPageRowChanged(int row);
    void onFieldsChanged();
    void onSelectionChanged(int index);
    void onPlacementFinished();

private:
    void setupUi();
    void setupShortcuts();
    void loadSettings();
    void saveWindowSettings();

    void closeDocument();
    void populatePageList();
    void updatePageListItem(int pageIndex);
    void setCurrentPage(int pageIndex);
    void renderCurrentPage();
    void refreshSelectionUi();
    void updateStatus();
    void updateActions();

    QString modeDisplayName() const;

    FormDocument *m_document = nullptr;
    FieldInteraction *m_interaction = nullptr;

    FormToolbar *m_toolbar = nullptr;
    QListWidget *m_pageList = nullptr;
    QScrollArea *m_scrollArea = nullptr;
    FormCanvas *m_canvas = nullptr;
    FieldPropertiesPanel *m_propertiesPanel = nullptr;
    QLabel *m_statusLabel = nullptr;

    int m_currentPageIndex = -1;
    qreal m_zoom = DEFAULT_ZOOM;
    QString m_lastOpenDir;
    QString m_lastSaveDir;
};

#endif // MAINWINDOW_H
