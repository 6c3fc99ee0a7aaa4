#ifndef SELECTIONCONTROLBAR_H
#define SELECTIONCONTROLBAR_H

#include <QWidget>

class QPushButton;

/**
 * @brief Floating "Change Model" / "Cancel" bar shown over the region selector.
 *
 * Centred horizontally with its bottom edge 10% of the screen height
 * above the bottom of the screen.
 */
class SelectionControlBar : public QWidget
{
    Q_OBJECT

public:
    explicit SelectionControlBar(QWidget* parent = nullptr);

    void setModelName(const QString& modelName);
    void setChangeModelVisible(bool visible);
    bool isChangeModelVisible() const { return m_changeModelVisible; }

    // Move to the bottom-centre position for a screen of this size
    void positionForScreen(const QSize& screenSize);

    QPushButton* changeModelButton() const { return m_changeModelButton; }
    QPushButton* cancelButton() const { return m_cancelButton; }

    static QString changeModelLabel(const QString& modelName);
    static int changeModelButtonWidth(const QString& label);
    static QRect barGeometry(const QSize& screenSize, const QSize& barSize);

signals:
    void changeModelRequested();
    void cancelRequested();

private:
    void updateBarSize();

    QPushButton* m_changeModelButton = nullptr;
    QPushButton* m_cancelButton = nullptr;
    bool m_changeModelVisible = true;
};

#endif // SELECTIONCONTROLBAR_H
