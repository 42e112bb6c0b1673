#ifndef FORMTOOLBAR_H
#define FORMTOOLBAR_H

#include <QWidget>
#include <QButtonGroup>
#include <QColor>
#include "../core/ToolType.h"

class QPaintEvent;
class QPushButton;

/**
 * FormToolbar - Document actions and editing modes.
 *
 * Layout:
 * [Open][Save]  gap  [Pointer][Add Text][Add Checkbox]  gap  [Delete][Duplicate]  gap  [Prev][Next]
 *
 * The three mode buttons are mutually exclusive.
 */
class FormToolbar : public QWidget {
    Q_OBJECT

public:
    explicit FormToolbar(QWidget *parent = nullptr);

    void setCurrentTool(ToolType tool);
    ToolType currentTool() const { return m_currentTool; }

    void setDocumentActionsEnabled(bool enabled);
    void setSelectionActionsEnabled(bool enabled);
    void setNavigationEnabled(bool canGoBack, bool canGoForward);

signals:
    void toolSelected(ToolType tool);
    void openClicked();
    void saveClicked();
    void deleteClicked();
    void duplicateClicked();
    void previousPageClicked();
    void nextPageClicked();

protected:
    void paintEvent(QPaintEvent *event) override;

private:
    void setupUi();
    void connectSignals();
    QPushButton* addModeButton(const QString& text, const QString& toolTip);

    // Action buttons
    QPushButton *m_openButton;
    QPushButton *m_saveButton;
    QPushButton *m_deleteButton;
    QPushButton *m_duplicateButton;
    QPushButton *m_prevButton;
    QPushButton *m_nextButton;

    // Mode buttons
    QPushButton *m_pointerButton;
    QPushButton *m_addTextButton;
    QPushButton *m_addCheckboxButton;

    // Mode group for exclusive selection
    QButtonGroup *m_toolGroup;

    QColor m_borderColor = QColor(0xD0, 0xD0, 0xD0);
    ToolType m_currentTool = ToolType::Pointer;
};

#endif // FORMTOOLBAR_H
