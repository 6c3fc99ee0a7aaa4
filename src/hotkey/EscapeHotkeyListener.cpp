/**
 * @file EscapeHotkeyListener.cpp
 */

#include "hotkey/EscapeHotkeyListener.h"

#include <QHotkey>
#include <QKeySequence>
#include <QDebug>

namespace NeoCR {

EscapeHotkeyListener::EscapeHotkeyListener(QObject* parent)
    : QObject(parent)
{
}

EscapeHotkeyListener::~EscapeHotkeyListener()
{
    stop();
}

bool EscapeHotkeyListener::start()
{
    if (m_hotkey) {
        return m_hotkey->isRegistered();
    }

    m_hotkey = new QHotkey(QKeySequence(Qt::Key_Escape), true, this);
    connect(m_hotkey, &QHotkey::activated, this, &EscapeHotkeyListener::escapePressed);

    if (!m_hotkey->isRegistered()) {
        qWarning() << "EscapeHotkeyListener: Global Escape unavailable, relying on window focus";
        return false;
    }

    qDebug() << "EscapeHotkeyListener: Registered global Escape";
    return true;
}

void EscapeHotkeyListener::stop()
{
    if (!m_hotkey) {
        return;
    }

    m_hotkey->setRegistered(false);
    delete m_hotkey;
    m_hotkey = nullptr;
    qDebug() << "EscapeHotkeyListener: Released global Escape";
}

bool EscapeHotkeyListener::isActive() const
{
    return m_hotkey && m_hotkey->isRegistered();
}

}  // namespace NeoCR
