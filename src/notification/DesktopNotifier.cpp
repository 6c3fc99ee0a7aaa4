#include "notification/DesktopNotifier.h"
#include "Constants.h"

#include <QProcess>
#include <QDebug>

DesktopNotifier::DesktopNotifier(QObject* parent)
    : QObject(parent)
    , m_program(QStringLiteral("notify-send"))
{
}

DesktopNotifier::~DesktopNotifier() = default;

QString DesktopNotifier::truncateForPreview(const QString& text)
{
    // Count characters, not UTF-16 units, and never split a surrogate pair
    qsizetype cut = 0;
    int characters = 0;
    while (cut < text.size() && characters < NeoCR::Notification::kPreviewLength) {
        const bool pair = text.at(cut).isHighSurrogate()
            && cut + 1 < text.size() && text.at(cut + 1).isLowSurrogate();
        cut += pair ? 2 : 1;
        ++characters;
    }

    if (cut >= text.size()) {
        return text;
    }
    return text.left(cut) + QLatin1String(NeoCR::Notification::kEllipsis);
}

bool DesktopNotifier::notifyTextCaptured(const QString& text)
{
    return notify(QString::fromUtf8(NeoCR::Notification::kTitle), truncateForPreview(text));
}

bool DesktopNotifier::notify(const QString& title, const QString& body)
{
    QProcess process;
    process.start(m_program, QStringList() << title << body);

    if (!process.waitForStarted(NeoCR::Timeout::kNotification)) {
        qWarning() << "DesktopNotifier: Could not start" << m_program << "-" << process.errorString();
        return false;
    }

    if (!process.waitForFinished(NeoCR::Timeout::kNotification)) {
        qWarning() << "DesktopNotifier:" << m_program << "timed out";
        process.kill();
        process.waitForFinished();
        return false;
    }

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        qWarning() << "DesktopNotifier:" << m_program << "exited with code" << process.exitCode();
        return false;
    }

    return true;
}
