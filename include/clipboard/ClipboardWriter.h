#ifndef CLIPBOARDWRITER_H
#define CLIPBOARDWRITER_H

#include "platform/SessionType.h"

#include <QObject>
#include <QString>
#include <QStringList>
#include <functional>

struct ClipboardHelper {
    QString program;
    QStringList arguments;

    bool isValid() const { return !program.isEmpty(); }
};

/**
 * @brief Writes the final text to the system clipboard.
 *
 * The process exits right after the write, so an external clipboard
 * owner (wl-copy, xclip, xsel) is preferred over QClipboard, whose
 * contents vanish with the process on X11 and Wayland.
 */
class ClipboardWriter : public QObject
{
    Q_OBJECT

public:
    explicit ClipboardWriter(QObject* parent = nullptr);
    ~ClipboardWriter() override;

    /**
     * @brief Write text to the clipboard, blocking until the helper exits.
     * @return false on failure, with the reason in errorMessage
     */
    virtual bool write(const QString& text, QString* errorMessage = nullptr);

    // Overrides helper detection; an invalid helper selects QClipboard
    void setHelper(const ClipboardHelper& helper);

    ClipboardHelper helper() const { return m_helper; }

    static ClipboardHelper selectHelper(SessionType session,
                                        const std::function<bool(const QString&)>& hasProgram);

private:
    bool writeWithHelper(const QString& text, QString* errorMessage);
    bool writeWithQt(const QString& text, QString* errorMessage);

    ClipboardHelper m_helper;
};

#endif // CLIPBOARDWRITER_H
