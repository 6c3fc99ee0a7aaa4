#ifndef ICAPTUREENGINE_H
#define ICAPTUREENGINE_H

#include <QObject>
#include <QRect>
#include <QImage>

class QScreen;

/**
 * @brief One-shot grab of a screen region
 *
 * Engines:
 * - QtCaptureEngine: QScreen::grabWindow(), X11 and non-Wayland sessions
 * - GrimCaptureEngine: Wayland sessions through the grim utility
 *
 * A failed grab returns a null image after emitting error().
 */
class ICaptureEngine : public QObject
{
    Q_OBJECT

public:
    explicit ICaptureEngine(QObject *parent = nullptr) : QObject(parent) {}
    virtual ~ICaptureEngine() = default;

    /**
     * @brief Grab a region synchronously
     * @param region Global logical coordinates; both sides must exceed 10 px
     * @param screen Screen the region was selected on
     */
    virtual QImage capture(const QRect &region, QScreen *screen) = 0;

    virtual QString engineName() const = 0;

    /**
     * @brief Engine matching the current desktop session
     * @return New instance owned by parent
     */
    static ICaptureEngine *createBestEngine(QObject *parent = nullptr);

    static bool isRegionLargeEnough(const QRect &region);

signals:
    void error(const QString &message);

protected:
    // Emits error() and returns false for regions at or below the minimum
    bool checkRegion(const QRect &region);
};

#endif // ICAPTUREENGINE_H
