#include "clipboard/ClipboardWriter.h"
#include "Constants.h"

#include <QClipboard>
#include <QGuiApplication>
#include <QProcess>
#include <QDebug>

ClipboardWriter::ClipboardWriter(QObject* parent)
    : QObject(parent)
    , m_helper(selectHelper(SessionDetector::detect(), &SessionDetector::hasProgram))
{
}

ClipboardWriter::~ClipboardWriter() = default;

void ClipboardWriter::setHelper(const ClipboardHelper& helper)
{
    m_helper = helper;
}

ClipboardHelper ClipboardWriter::selectHelper(SessionType session,
                                              const std::function<bool(const QString&)>& hasProgram)
{
    const QString wlCopy = QStringLiteral("wl-copy");
    const QString xclip = QStringLiteral("xclip");
    const QString xsel = QStringLiteral("xsel");

    if (session == SessionType::Wayland && hasProgram(wlCopy)) {
        return {wlCopy, {}};
    }

    // XWayland sessions can still fall through to the X11 helpers
    if (session != SessionType::Other) {
        if (hasProgram(xclip)) {
            return {xclip, {QStringLiteral("-selection"), QStringLiteral("clipboard")}};
        }
        if (hasProgram(xsel)) {
            return {xsel, {QStringLiteral("--clipboard"), QStringLiteral("--input")}};
        }
    }

    return {};
}

bool ClipboardWriter::write(const QString& text, QString* errorMessage)
{
    if (m_helper.isValid()) {
        return writeWithHelper(text, errorMessage);
    }
    return writeWithQt(text, errorMessage);
}

bool ClipboardWriter::writeWithHelper(const QString& text, QString* errorMessage)
{
    QProcess process;
    process.start(m_helper.program, m_helper.arguments);

    if (!process.waitForStarted(NeoCR::Timeout::kClipboardHelper)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Could not start %1: %2")
                                .arg(m_helper.program, process.errorString());
        }
        return false;
    }

    process.write(text.toUtf8());
    process.closeWriteChannel();

    if (!process.waitForFinished(NeoCR::Timeout::kClipboardHelper)) {
        process.kill();
        process.waitForFinished();
        if (errorMessage) {
            *errorMessage = QStringLiteral("%1 timed out").arg(m_helper.program);
        }
        return false;
    }

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("%1 exited with code %2")
                                .arg(m_helper.program).arg(process.exitCode());
        }
        return false;
    }

    qDebug() << "ClipboardWriter: Copied" << text.size() << "characters via" << m_helper.program;
    return true;
}

bool ClipboardWriter::writeWithQt(const QString& text, QString* errorMessage)
{
    QClipboard* clipboard = QGuiApplication::clipboard();
    if (!clipboard) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("No clipboard available");
        }
        return false;
    }

    clipboard->setText(text);
    qDebug() << "ClipboardWriter: Copied" << text.size() << "characters via QClipboard";
    return true;
}
