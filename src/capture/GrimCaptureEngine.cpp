#include "capture/GrimCaptureEngine.h"
#include "platform/SessionType.h"
#include "Constants.h"

#include <QProcess>
#include <QDebug>

GrimCaptureEngine::GrimCaptureEngine(QObject *parent)
    : ICaptureEngine(parent)
    , m_program(QStringLiteral("grim"))
{
}

bool GrimCaptureEngine::isAvailable()
{
    return SessionDetector::hasProgram(QStringLiteral("grim"));
}

QString GrimCaptureEngine::geometryArgument(const QRect &region)
{
    return QStringLiteral("%1,%2 %3x%4")
        .arg(region.x()).arg(region.y())
        .arg(region.width()).arg(region.height());
}

QStringList GrimCaptureEngine::arguments(const QRect &region)
{
    return {QStringLiteral("-t"), QStringLiteral("png"),
            QStringLiteral("-g"), geometryArgument(region),
            QStringLiteral("-")};
}

QImage GrimCaptureEngine::capture(const QRect &region, QScreen *screen)
{
    Q_UNUSED(screen)

    if (!checkRegion(region)) {
        return QImage();
    }

    QProcess process;
    process.start(m_program, arguments(region));

    if (!process.waitForStarted(NeoCR::Timeout::kScreenGrabProcess)) {
        emit error(QStringLiteral("Could not run %1: %2").arg(m_program, process.errorString()));
        return QImage();
    }

    if (!process.waitForFinished(NeoCR::Timeout::kScreenGrabProcess)) {
        process.kill();
        process.waitForFinished();
        emit error(QStringLiteral("%1 timed out").arg(m_program));
        return QImage();
    }

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        const QString stderrText = QString::fromLocal8Bit(process.readAllStandardError()).trimmed();
        emit error(QStringLiteral("%1 exited with code %2: %3")
                       .arg(m_program).arg(process.exitCode()).arg(stderrText));
        return QImage();
    }

    QImage image;
    if (!image.loadFromData(process.readAllStandardOutput(), "PNG")) {
        emit error(QStringLiteral("%1 did not produce a PNG image").arg(m_program));
        return QImage();
    }

    qDebug() << "GrimCaptureEngine: Grabbed" << geometryArgument(region) << "->" << image.size();
    return image;
}
