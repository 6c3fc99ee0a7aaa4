#ifndef SELECTIONSTATEMANAGER_H
#define SELECTIONSTATEMANAGER_H

#include <QObject>
#include <QRect>
#include <QPoint>

/**
 * @brief Drag-to-select state machine
 *
 * Idle -> Dragging on press, back to Idle on a release that yields a
 * region not exceeding the minimum size, Completed otherwise. Cancelled
 * is reachable from Idle and Dragging. Completed and Cancelled are final
 * until reset().
 */
class SelectionStateManager : public QObject {
    Q_OBJECT

public:
    enum class State {
        Idle,       // No selection
        Dragging,   // Pointer held, rectangle follows the pointer
        Completed,  // Region accepted and frozen
        Cancelled   // Selection abandoned
    };
    Q_ENUM(State)

    explicit SelectionStateManager(QObject* parent = nullptr);

    State state() const { return m_state; }
    bool isIdle() const { return m_state == State::Idle; }
    bool isDragging() const { return m_state == State::Dragging; }
    bool isCompleted() const { return m_state == State::Completed; }
    bool isCancelled() const { return m_state == State::Cancelled; }
    bool isFinished() const { return isCompleted() || isCancelled(); }

    // Current candidate while dragging, accepted region once completed
    QRect selectionRect() const { return m_selectionRect; }

    // Positions are clamped to bounds when bounds are set
    void setBounds(const QRect& bounds);
    QRect bounds() const { return m_bounds; }

    void startSelection(const QPoint& pos);
    void updateSelection(const QPoint& pos);

    /**
     * @brief Finish the drag.
     * @return true if the region was accepted
     */
    bool finishSelection();

    /**
     * @brief Abandon the selection.
     * @return false if already cancelled or completed (no transition)
     */
    bool cancel();

    // Back to Idle with no rectangle
    void reset();

    /**
     * @brief Rectangle spanned by two corner points.
     *
     * Width and height are the absolute coordinate differences, so the
     * far corner is exclusive (unlike QRect(QPoint, QPoint)).
     */
    static QRect normalizedRegion(const QPoint& a, const QPoint& b);

    // Both dimensions strictly above the minimum
    static bool isValidRegion(const QRect& rect);

signals:
    void stateChanged(State newState);
    void selectionChanged(const QRect& rect);

private:
    void setState(State state);
    QPoint clampToBounds(const QPoint& pos) const;

    State m_state = State::Idle;
    QRect m_selectionRect;
    QRect m_bounds;
    QPoint m_anchor;
};

#endif // SELECTIONSTATEMANAGER_H
