#ifndef GRIMCAPTUREENGINE_H
#define GRIMCAPTUREENGINE_H

#include "ICaptureEngine.h"

#include <QStringList>

/**
 * @brief Wayland region grab via grim
 *
 * grim reads the region in global logical coordinates and writes a PNG
 * to stdout, decoded in memory. The screen argument is not needed.
 */
class GrimCaptureEngine : public ICaptureEngine
{
    Q_OBJECT

public:
    explicit GrimCaptureEngine(QObject *parent = nullptr);

    QImage capture(const QRect &region, QScreen *screen) override;
    QString engineName() const override { return QStringLiteral("grim"); }

    static bool isAvailable();

    // "x,y wxh" geometry argument for grim -g
    static QString geometryArgument(const QRect &region);
    static QStringList arguments(const QRect &region);

    void setProgram(const QString &program) { m_program = program; }

private:
    QString m_program;
};

#endif // GRIMCAPTUREENGINE_H
