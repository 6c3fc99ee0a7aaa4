#include "capture/QtCaptureEngine.h"

#include <QScreen>
#include <QPixmap>
#include <QDebug>

QtCaptureEngine::QtCaptureEngine(QObject *parent)
    : ICaptureEngine(parent)
{
}

QImage QtCaptureEngine::capture(const QRect &region, QScreen *screen)
{
    if (!screen) {
        emit error(QStringLiteral("No screen to capture from"));
        return QImage();
    }
    if (!checkRegion(region)) {
        return QImage();
    }

    // grabWindow() wants screen-local logical coordinates and hands back
    // device pixels on HiDPI screens
    const QRect local = region.translated(-screen->geometry().topLeft());
    const QPixmap pixmap = screen->grabWindow(0, local.x(), local.y(), local.width(), local.height());
    if (pixmap.isNull()) {
        emit error(QStringLiteral("Screen grab of %1 returned nothing").arg(screen->name()));
        return QImage();
    }

    qDebug() << "QtCaptureEngine: Grabbed" << region << "->" << pixmap.size();
    return pixmap.toImage();
}
