#ifndef DESKTOPNOTIFIER_H
#define DESKTOPNOTIFIER_H

#include <QObject>
#include <QString>

/**
 * @brief Best-effort desktop notifications through notify-send.
 *
 * Failures (missing binary, timeout, non-zero exit) are logged and
 * reported through the return value only; they never abort a run.
 */
class DesktopNotifier : public QObject
{
    Q_OBJECT

public:
    explicit DesktopNotifier(QObject* parent = nullptr);
    ~DesktopNotifier() override;

    // Notify with the fixed capture title and a preview of text
    bool notifyTextCaptured(const QString& text);

    virtual bool notify(const QString& title, const QString& body);

    void setProgram(const QString& program) { m_program = program; }
    QString program() const { return m_program; }

    /**
     * @brief First 200 characters of text, followed by "..." when longer.
     */
    static QString truncateForPreview(const QString& text);

private:
    QString m_program;
};

#endif // DESKTOPNOTIFIER_H
