#ifndef SESSIONTYPE_H
#define SESSIONTYPE_H

#include <QString>

enum class SessionType {
    Wayland,
    X11,
    Other
};

/**
 * Desktop session detection from XDG_SESSION_TYPE, WAYLAND_DISPLAY and DISPLAY.
 */
class SessionDetector {
public:
    SessionDetector() = delete;

    static SessionType detect();

    // Pure form of detect() for the given environment values
    static SessionType fromEnvironment(const QString& xdgSessionType,
                                       const QString& waylandDisplay,
                                       const QString& display);

    // Whether an executable with this name is found on PATH
    static bool hasProgram(const QString& program);
};

#endif // SESSIONTYPE_H
