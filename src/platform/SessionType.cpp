#include "platform/SessionType.h"

#include <QStandardPaths>

SessionType SessionDetector::detect()
{
    return fromEnvironment(qEnvironmentVariable("XDG_SESSION_TYPE"),
                           qEnvironmentVariable("WAYLAND_DISPLAY"),
                           qEnvironmentVariable("DISPLAY"));
}

SessionType SessionDetector::fromEnvironment(const QString& xdgSessionType,
                                             const QString& waylandDisplay,
                                             const QString& display)
{
    const QString type = xdgSessionType.trimmed().toLower();
    if (type == QLatin1String("wayland")) {
        return SessionType::Wayland;
    }
    if (type == QLatin1String("x11")) {
        return SessionType::X11;
    }

    // XDG_SESSION_TYPE missing or "tty" inside nested sessions
    if (!waylandDisplay.isEmpty()) {
        return SessionType::Wayland;
    }
    if (!display.isEmpty()) {
        return SessionType::X11;
    }
    return SessionType::Other;
}

bool SessionDetector::hasProgram(const QString& program)
{
    return !QStandardPaths::findExecutable(program).isEmpty();
}
