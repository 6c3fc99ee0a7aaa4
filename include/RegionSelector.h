#ifndef REGIONSELECTOR_H
#define REGIONSELECTOR_H

#include <QWidget>
#include <QPixmap>
#include <QPoint>
#include <QRect>
#include <QString>

#include "region/SelectionStateManager.h"

class QScreen;
class QPainter;
class SelectionControlBar;

/**
 * @brief Full-screen drag-to-select overlay
 *
 * Shows a frozen snapshot of the screen, dims everything outside the
 * selection and reports the chosen region in global coordinates. Exactly
 * one of regionSelected(), selectionCancelled() or modelChangeRequested()
 * is emitted per initialisation.
 */
class RegionSelector : public QWidget
{
    Q_OBJECT

public:
    explicit RegionSelector(QWidget *parent = nullptr);
    ~RegionSelector() override;

    // Initialise for a screen; preCapture avoids grabbing our own window
    void initializeForScreen(QScreen *screen, const QPixmap &preCapture = QPixmap());

    void setModelName(const QString &modelName);
    void setModelChangeAllowed(bool allowed);

    SelectionStateManager *selectionManager() const { return m_selectionManager; }
    SelectionControlBar *controlBar() const { return m_controlBar; }
    QScreen *currentScreen() const { return m_currentScreen; }

    bool hasSnapshot() const { return !m_backgroundPixmap.isNull(); }

public slots:
    /**
     * @brief Abandon the selection and close.
     *
     * Safe to call repeatedly and after completion; only the first
     * effective call emits selectionCancelled().
     */
    void cancelSelection();

signals:
    void regionSelected(const QRect &globalRegion);
    void selectionCancelled();
    void modelChangeRequested();

protected:
    void paintEvent(QPaintEvent *event) override;
    void mousePressEvent(QMouseEvent *event) override;
    void mouseMoveEvent(QMouseEvent *event) override;
    void mouseReleaseEvent(QMouseEvent *event) override;
    void keyPressEvent(QKeyEvent *event) override;
    void closeEvent(QCloseEvent *event) override;
    bool eventFilter(QObject *obj, QEvent *event) override;

private slots:
    void onChangeModelClicked();

private:
    void setupScreenGeometry(QScreen *screen);
    void releaseSnapshot();

    // Shade everything except hole
    void drawDimming(QPainter &painter, const QRect &hole);
    void drawSelectionFrame(QPainter &painter, const QRect &sel);
    void drawSizeLabel(QPainter &painter, const QRect &sel);
    void drawCrosshair(QPainter &painter);

    QScreen *m_currentScreen;
    QPixmap m_backgroundPixmap;
    SelectionStateManager *m_selectionManager;
    SelectionControlBar *m_controlBar;
    QPoint m_currentPoint;
    QString m_modelName;
};

#endif // REGIONSELECTOR_H
