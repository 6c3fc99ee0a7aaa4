#include "NeoCRApplication.h"
#include "RegionSelector.h"
#include "capture/ICaptureEngine.h"
#include "clipboard/ClipboardWriter.h"
#include "hotkey/EscapeHotkeyListener.h"
#include "notification/DesktopNotifier.h"
#include "ocr/OllamaOCRBackend.h"
#include "ocr/VisionModelClassifier.h"
#include "settings/ModelSettingsManager.h"
#include "ui/ModelSelectorDialog.h"

#include <QApplication>
#include <QCursor>
#include <QGuiApplication>
#include <QScreen>
#include <QTextStream>
#include <QTimer>
#include <QDebug>

using NeoCR::CLI::CLIResult;

namespace {
// Time for the compositor to remove the overlay before the region is grabbed
constexpr int kOverlayHideDelayMs = 150;
constexpr int kRuleWidth = 50;
}

NeoCRApplication::NeoCRApplication(const NeoCR::CLI::RunOptions &options, QObject *parent)
    : QObject(parent)
    , m_selectModelFirst(options.selectModel)
    , m_escapeListener(new NeoCR::EscapeHotkeyListener(this))
    , m_captureEngine(ICaptureEngine::createBestEngine(this))
    , m_backend(nullptr)
    , m_clipboard(new ClipboardWriter(this))
    , m_notifier(new DesktopNotifier(this))
    , m_pipeline(nullptr)
{
    const auto &settings = ModelSettingsManager::instance();
    m_model = options.model.isEmpty() ? settings.lastModel() : options.model;
    m_serverUrl = options.host.isEmpty() ? settings.ollamaUrl() : options.host;
    while (m_serverUrl.endsWith('/')) {
        m_serverUrl.chop(1);
    }
    m_language = options.language.isEmpty() ? settings.language() : options.language;

    m_backend = new OllamaOCRBackend(m_serverUrl, this);
    m_pipeline = new OCRPipeline(m_captureEngine, m_backend, m_clipboard, m_notifier, this);

    connect(m_pipeline, &OCRPipeline::ocrCompleted, this, &NeoCRApplication::onOCRCompleted);
    connect(m_pipeline, &OCRPipeline::ocrFailed, this, &NeoCRApplication::onOCRFailed);

    qDebug() << "NeoCRApplication: Model" << m_model << "server" << m_serverUrl
             << "language" << m_language << "capture engine" << m_captureEngine->engineName();
}

NeoCRApplication::~NeoCRApplication()
{
    m_escapeListener->stop();
    if (m_regionSelector) {
        delete m_regionSelector;
    }
}

CLIResult::Code NeoCRApplication::codeForStage(OCRPipeline::Stage stage)
{
    switch (stage) {
    case OCRPipeline::Stage::Capture:     return CLIResult::Code::CaptureError;
    case OCRPipeline::Stage::Recognition: return CLIResult::Code::OCRError;
    case OCRPipeline::Stage::Clipboard:   return CLIResult::Code::ClipboardError;
    }
    return CLIResult::Code::GeneralError;
}

QString NeoCRApplication::formatResult(const QString &text)
{
    const QString rule(kRuleWidth, QLatin1Char('='));
    return QStringLiteral("%1\nOCR Result (also copied to clipboard):\n%1\n%2\n%1\n").arg(rule, text);
}

void NeoCRApplication::start()
{
    if (m_selectModelFirst) {
        showModelSelector();
        return;
    }
    startRegionSelection();
}

void NeoCRApplication::startRegionSelection()
{
    if (m_regionSelector && m_regionSelector->isVisible()) {
        qDebug() << "NeoCRApplication: Already selecting, ignoring";
        return;
    }

    m_targetScreen = QGuiApplication::screenAt(QCursor::pos());
    if (!m_targetScreen) {
        m_targetScreen = QGuiApplication::primaryScreen();
    }
    if (!m_targetScreen) {
        finish(CLIResult::error(CLIResult::Code::CaptureError, QStringLiteral("No screen available")));
        return;
    }

    // Snapshot before the overlay exists so it does not capture itself
    QPixmap preCapture = m_targetScreen->grabWindow(0);
    qDebug() << "NeoCRApplication: Screenshot captured, size:" << preCapture.size();

    m_regionSelector = new RegionSelector();
    m_regionSelector->setAttribute(Qt::WA_DeleteOnClose);
    m_regionSelector->initializeForScreen(m_targetScreen, preCapture);
    m_regionSelector->setModelName(m_model);
    m_regionSelector->setModelChangeAllowed(true);

    connect(m_regionSelector, &RegionSelector::regionSelected,
            this, &NeoCRApplication::onRegionSelected);
    connect(m_regionSelector, &RegionSelector::selectionCancelled,
            this, &NeoCRApplication::onSelectionCancelled);
    connect(m_regionSelector, &RegionSelector::modelChangeRequested,
            this, &NeoCRApplication::onModelChangeRequested);

    // Global Escape arrives outside the selector's event delivery
    connect(m_escapeListener, &NeoCR::EscapeHotkeyListener::escapePressed,
            m_regionSelector, &RegionSelector::cancelSelection, Qt::QueuedConnection);
    m_escapeListener->start();

    m_regionSelector->setGeometry(m_targetScreen->geometry());
    m_regionSelector->show();
    m_regionSelector->activateWindow();
    m_regionSelector->raise();
}

void NeoCRApplication::onRegionSelected(const QRect &globalRegion)
{
    m_escapeListener->stop();
    qDebug() << "NeoCRApplication: Region selected" << globalRegion;

    QTimer::singleShot(kOverlayHideDelayMs, this, [this, globalRegion]() {
        m_pipeline->run(globalRegion, m_targetScreen, m_model, m_language);
    });
}

void NeoCRApplication::onSelectionCancelled()
{
    m_escapeListener->stop();
    finish(CLIResult::cancellation());
}

void NeoCRApplication::onModelChangeRequested()
{
    m_escapeListener->stop();

    // Leave the selector's signal emission before opening a modal dialog
    QTimer::singleShot(0, this, &NeoCRApplication::showModelSelector);
}

void NeoCRApplication::showModelSelector()
{
    const QString chosen = m_modelPrompt ? m_modelPrompt(m_model) : promptWithDialog();
    if (chosen.isEmpty()) {
        qDebug() << "NeoCRApplication: Model selection cancelled";
        finish(CLIResult::cancellation());
        return;
    }

    m_model = chosen;
    auto &settings = ModelSettingsManager::instance();
    settings.setLastModel(m_model);
    settings.save();
    qDebug() << "NeoCRApplication: Model changed to" << m_model;

    startRegionSelection();
}

QString NeoCRApplication::promptWithDialog() const
{
    ModelSelectorDialog dialog(VisionModelClassifier::defaultVisionModels(), m_model);
    dialog.setServerUrl(m_serverUrl);
    dialog.showAt();

    if (dialog.exec() != QDialog::Accepted) {
        return QString();
    }
    return dialog.selectedModel();
}

void NeoCRApplication::onOCRCompleted(const QString &text)
{
    QTextStream out(stdout);
    out << formatResult(text);
    out.flush();

    finish(CLIResult::success(QStringLiteral("Text copied to clipboard.")));
}

void NeoCRApplication::onOCRFailed(OCRPipeline::Stage stage, const QString &message)
{
    finish(CLIResult::error(codeForStage(stage),
                            QStringLiteral("%1 error: %2").arg(OCRPipeline::stageName(stage), message)));
}

void NeoCRApplication::finish(const CLIResult &result)
{
    if (m_finished) {
        return;
    }
    m_finished = true;
    emit finished(result);
}
