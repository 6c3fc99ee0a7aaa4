#include "capture/ICaptureEngine.h"
#include "capture/QtCaptureEngine.h"
#include "capture/GrimCaptureEngine.h"
#include "platform/SessionType.h"
#include "Constants.h"

#include <QDebug>

ICaptureEngine *ICaptureEngine::createBestEngine(QObject *parent)
{
    if (SessionDetector::detect() == SessionType::Wayland) {
        if (GrimCaptureEngine::isAvailable()) {
            qDebug() << "ICaptureEngine: Using grim engine";
            return new GrimCaptureEngine(parent);
        }
        qWarning() << "ICaptureEngine: Wayland session without grim, using Qt fallback";
    }

    qDebug() << "ICaptureEngine: Using Qt capture engine";
    return new QtCaptureEngine(parent);
}

bool ICaptureEngine::isRegionLargeEnough(const QRect &region)
{
    return !region.isEmpty() &&
           region.width() > NeoCR::Selection::kMinimumSize &&
           region.height() > NeoCR::Selection::kMinimumSize;
}

bool ICaptureEngine::checkRegion(const QRect &region)
{
    if (isRegionLargeEnough(region)) {
        return true;
    }
    emit error(QStringLiteral("Capture region %1x%2 too small (both sides must exceed %3 px)")
                   .arg(region.width()).arg(region.height()).arg(NeoCR::Selection::kMinimumSize));
    return false;
}
