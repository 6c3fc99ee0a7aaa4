#include "ocr/OCRPipeline.h"
#include "ocr/IOCRBackend.h"
#include "capture/ICaptureEngine.h"
#include "clipboard/ClipboardWriter.h"
#include "notification/DesktopNotifier.h"
#include "settings/ModelSettingsManager.h"

#include <QDir>
#include <QImage>
#include <QPointer>
#include <QTemporaryFile>
#include <QDebug>

OCRPipeline::OCRPipeline(ICaptureEngine *captureEngine,
                         IOCRBackend *backend,
                         ClipboardWriter *clipboard,
                         DesktopNotifier *notifier,
                         QObject *parent)
    : QObject(parent)
    , m_captureEngine(captureEngine)
    , m_backend(backend)
    , m_clipboard(clipboard)
    , m_notifier(notifier)
{
}

OCRPipeline::~OCRPipeline() = default;

QString OCRPipeline::stageName(Stage stage)
{
    switch (stage) {
    case Stage::Capture:     return QStringLiteral("capture");
    case Stage::Recognition: return QStringLiteral("OCR");
    case Stage::Clipboard:   return QStringLiteral("clipboard");
    }
    return QString();
}

bool OCRPipeline::run(const QRect &region, QScreen *screen, const QString &model,
                      const QString &language)
{
    if (m_running) {
        qWarning() << "OCRPipeline: Run already in progress";
        return false;
    }
    m_running = true;
    m_lastArtifactPath.clear();

    qDebug() << "OCRPipeline: Processing region" << region << "with model" << model;

    // Engines report details through error(); keep the last one
    QString captureError;
    QMetaObject::Connection errorConnection =
        connect(m_captureEngine, &ICaptureEngine::error, this,
                [&captureError](const QString &message) { captureError = message; });

    const QImage image = m_captureEngine->capture(region, screen);
    disconnect(errorConnection);

    if (image.isNull()) {
        fail(Stage::Capture, captureError.isEmpty() ? QStringLiteral("Failed to capture region")
                                                    : captureError);
        return true;
    }

    QString artifactError;
    if (!writeArtifact(image, &artifactError)) {
        fail(Stage::Capture, artifactError);
        return true;
    }

    OCRRequest request;
    request.imagePath = m_lastArtifactPath;
    request.model = model;
    request.language = language;

    QPointer<OCRPipeline> guard(this);
    m_backend->recognize(request, [guard, model](bool success, const QString &text, const QString &error) {
        if (guard) {
            guard->onRecognitionFinished(success, text, error, model);
        }
    });
    return true;
}

bool OCRPipeline::writeArtifact(const QImage &image, QString *errorMessage)
{
    m_artifact = std::make_unique<QTemporaryFile>(QDir::tempPath() + QStringLiteral("/neocr_XXXXXX.png"));
    if (!m_artifact->open()) {
        *errorMessage = QStringLiteral("Cannot create temporary image: %1").arg(m_artifact->errorString());
        m_artifact.reset();
        return false;
    }

    m_lastArtifactPath = m_artifact->fileName();
    if (!image.save(m_artifact.get(), "PNG")) {
        *errorMessage = QStringLiteral("Cannot encode captured image");
        m_artifact.reset();
        return false;
    }
    m_artifact->flush();
    m_artifact->close();
    return true;
}

void OCRPipeline::onRecognitionFinished(bool success, const QString &text, const QString &error,
                                        const QString &model)
{
    // QTemporaryFile removes the file on destruction
    m_artifact.reset();

    if (!success) {
        fail(Stage::Recognition, error.isEmpty() ? QStringLiteral("OCR failed") : error);
        return;
    }

    QString clipboardError;
    if (!m_clipboard->write(text, &clipboardError)) {
        fail(Stage::Clipboard, clipboardError);
        return;
    }

    auto& settings = ModelSettingsManager::instance();
    settings.setLastModel(model);
    settings.save();

    if (m_notifier && !m_notifier->notifyTextCaptured(text)) {
        qDebug() << "OCRPipeline: Notification not shown";
    }

    m_running = false;
    emit ocrCompleted(text);
}

void OCRPipeline::fail(Stage stage, const QString &message)
{
    m_artifact.reset();
    m_running = false;
    qCritical() << "OCRPipeline:" << stageName(stage) << "failed:" << message;
    emit ocrFailed(stage, message);
}
