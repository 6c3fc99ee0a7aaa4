#include "region/SelectionStateManager.h"
#include "Constants.h"

#include <QtGlobal>

SelectionStateManager::SelectionStateManager(QObject* parent)
    : QObject(parent)
{
}

void SelectionStateManager::setState(State state)
{
    if (m_state != state) {
        m_state = state;
        emit stateChanged(m_state);
    }
}

void SelectionStateManager::setBounds(const QRect& bounds)
{
    m_bounds = bounds;
}

QPoint SelectionStateManager::clampToBounds(const QPoint& pos) const
{
    if (m_bounds.isEmpty()) {
        return pos;
    }

    // The far edge is exclusive for normalizedRegion, so allow left + width
    return QPoint(qBound(m_bounds.left(), pos.x(), m_bounds.left() + m_bounds.width()),
                  qBound(m_bounds.top(), pos.y(), m_bounds.top() + m_bounds.height()));
}

QRect SelectionStateManager::normalizedRegion(const QPoint& a, const QPoint& b)
{
    return QRect(qMin(a.x(), b.x()), qMin(a.y(), b.y()),
                 qAbs(b.x() - a.x()), qAbs(b.y() - a.y()));
}

bool SelectionStateManager::isValidRegion(const QRect& rect)
{
    return rect.width() > NeoCR::Selection::kMinimumSize &&
           rect.height() > NeoCR::Selection::kMinimumSize;
}

// ============================================================================
// Selection Operations
// ============================================================================

void SelectionStateManager::startSelection(const QPoint& pos)
{
    if (m_state != State::Idle) return;

    m_anchor = clampToBounds(pos);
    m_selectionRect = QRect(m_anchor, QSize(0, 0));
    setState(State::Dragging);
    emit selectionChanged(m_selectionRect);
}

void SelectionStateManager::updateSelection(const QPoint& pos)
{
    if (m_state != State::Dragging) return;

    m_selectionRect = normalizedRegion(m_anchor, clampToBounds(pos));
    emit selectionChanged(m_selectionRect);
}

bool SelectionStateManager::finishSelection()
{
    if (m_state != State::Dragging) return false;

    if (!isValidRegion(m_selectionRect)) {
        // Too small, implicit retry
        reset();
        return false;
    }

    setState(State::Completed);
    return true;
}

bool SelectionStateManager::cancel()
{
    if (isFinished()) return false;

    m_selectionRect = QRect();
    setState(State::Cancelled);
    emit selectionChanged(QRect());
    return true;
}

void SelectionStateManager::reset()
{
    m_selectionRect = QRect();
    m_anchor = QPoint();
    setState(State::Idle);
    emit selectionChanged(QRect());
}
