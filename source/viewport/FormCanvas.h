// ============================================================================
// FormCanvas - Page bitmap with editable form field overlays
// ============================================================================
// Paints the rendered page, the outline of each field on it, the selection
// and its resize handle. Mouse input (left button) is forwarded in pixel
// coordinates to the FieldInteraction, which makes every editing decision.
//
// The canvas is sized to the page bitmap and meant to live in a QScrollArea.
// ============================================================================

#pragma once

#include <QPixmap>
#include <QWidget>

class FieldInteraction;
struct FormField;

class FormCanvas : public QWidget {
    Q_OBJECT

public:
    static constexpr int MIN_WIDTH = 500;
    static constexpr int MIN_HEIGHT = 600;

    explicit FormCanvas(FieldInteraction* interaction, QWidget* parent = nullptr);

    /**
     * @brief Show a rendered page. The canvas resizes to the bitmap.
     */
    void setPagePixmap(const QPixmap& pixmap);

    /**
     * @brief Drop the bitmap and show the placeholder text.
     */
    void clearPage(const QString& placeholder = QString());

    bool hasPage() const { return !m_pixmap.isNull(); }
    QSize pixmapSize() const { return m_pixmap.size(); }

    QSize sizeHint() const override;

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;

private:
    void drawField(QPainter& painter, const FormField& field, bool selected) const;
    void updateCursor(const QPointF& pixelPos);

    FieldInteraction* m_interaction;    ///< Not owned
    QPixmap m_pixmap;
    QString m_placeholder;
    bool m_pointerDown = false;
};
