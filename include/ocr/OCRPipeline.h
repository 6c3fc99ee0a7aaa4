#ifndef OCRPIPELINE_H
#define OCRPIPELINE_H

#include <QObject>
#include <QRect>
#include <QString>

#include <memory>

class QScreen;
class QTemporaryFile;
class ICaptureEngine;
class IOCRBackend;
class ClipboardWriter;
class DesktopNotifier;

/**
 * @brief Capture -> OCR -> clipboard -> notification for one region.
 *
 * The collaborators are not owned. The transient PNG handed to the
 * backend is removed as soon as recognition finishes, whatever the
 * outcome. Exactly one of ocrCompleted() or ocrFailed() is emitted per
 * run().
 */
class OCRPipeline : public QObject
{
    Q_OBJECT

public:
    enum class Stage {
        Capture,
        Recognition,
        Clipboard
    };
    Q_ENUM(Stage)

    OCRPipeline(ICaptureEngine *captureEngine,
                IOCRBackend *backend,
                ClipboardWriter *clipboard,
                DesktopNotifier *notifier,
                QObject *parent = nullptr);
    ~OCRPipeline() override;

    /**
     * @brief Start processing a region.
     * @return false if a run is already in progress
     */
    bool run(const QRect &region, QScreen *screen, const QString &model,
             const QString &language = QStringLiteral("English"));

    bool isRunning() const { return m_running; }

    // Path of the transient image of the current or last run
    QString lastArtifactPath() const { return m_lastArtifactPath; }

    static QString stageName(Stage stage);

signals:
    void ocrCompleted(const QString &text);
    void ocrFailed(OCRPipeline::Stage stage, const QString &message);

private:
    bool writeArtifact(const QImage &image, QString *errorMessage);
    void onRecognitionFinished(bool success, const QString &text, const QString &error,
                               const QString &model);
    void fail(Stage stage, const QString &message);

    ICaptureEngine *m_captureEngine;
    IOCRBackend *m_backend;
    ClipboardWriter *m_clipboard;
    DesktopNotifier *m_notifier;

    std::unique_ptr<QTemporaryFile> m_artifact;
    QString m_lastArtifactPath;
    bool m_running = false;
};

#endif // OCRPIPELINE_H
