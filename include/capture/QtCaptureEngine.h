#ifndef QTCAPTUREENGINE_H
#define QTCAPTUREENGINE_H

#include "ICaptureEngine.h"

/**
 * @brief Region grab through QScreen::grabWindow()
 *
 * Most Wayland compositors refuse this, see GrimCaptureEngine.
 */
class QtCaptureEngine : public ICaptureEngine
{
    Q_OBJECT

public:
    explicit QtCaptureEngine(QObject *parent = nullptr);

    QImage capture(const QRect &region, QScreen *screen) override;
    QString engineName() const override { return QStringLiteral("Qt Screen Grab"); }
};

#endif // QTCAPTUREENGINE_H
