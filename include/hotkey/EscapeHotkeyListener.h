/**
 * @file EscapeHotkeyListener.h
 * @brief System-wide Escape shortcut held while a region is being selected
 */

#pragma once

#include <QObject>

class QHotkey;

namespace NeoCR {

/**
 * @brief Registers Escape as a global hotkey between start() and stop().
 *
 * The full-screen selector does not always receive keyboard focus (some
 * window managers keep it on the previous window), so Escape is also
 * grabbed globally. Connect escapePressed() with Qt::QueuedConnection so
 * that receivers run on the next event-loop turn.
 *
 * Usage:
 * @code
 * auto* listener = new EscapeHotkeyListener(this);
 * connect(listener, &EscapeHotkeyListener::escapePressed,
 *         selector, &RegionSelector::cancelSelection, Qt::QueuedConnection);
 * listener->start();
 * @endcode
 */
class EscapeHotkeyListener : public QObject
{
    Q_OBJECT

public:
    explicit EscapeHotkeyListener(QObject* parent = nullptr);
    ~EscapeHotkeyListener() override;

    /**
     * @brief Register the global shortcut.
     * @return false if the platform refused the registration
     */
    bool start();

    /**
     * @brief Unregister the shortcut. Safe to call repeatedly.
     */
    void stop();

    bool isActive() const;

signals:
    void escapePressed();

private:
    QHotkey* m_hotkey = nullptr;
};

}  // namespace NeoCR
