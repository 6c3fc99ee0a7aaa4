#ifndef NEOCRAPPLICATION_H
#define NEOCRAPPLICATION_H

#include <QObject>
#include <QPointer>
#include <QRect>
#include <QString>

#include <functional>
#include <utility>

#include "cli/CLIHandler.h"
#include "ocr/OCRPipeline.h"

class QScreen;
class RegionSelector;
class ICaptureEngine;
class IOCRBackend;
class ClipboardWriter;
class DesktopNotifier;

namespace NeoCR {
class EscapeHotkeyListener;
}

/**
 * @brief Drives one run: optional model choice, region selection, OCR.
 *
 * finished() is emitted exactly once with the result of the run.
 */
class NeoCRApplication : public QObject
{
    Q_OBJECT

public:
    explicit NeoCRApplication(const NeoCR::CLI::RunOptions &options, QObject *parent = nullptr);
    ~NeoCRApplication() override;

    QString model() const { return m_model; }
    QString serverUrl() const { return m_serverUrl; }
    QString language() const { return m_language; }

    // Returns the chosen model, or an empty string when the user cancels
    using ModelPrompt = std::function<QString(const QString &currentModel)>;

    // Replace the Model Selector dialog, e.g. for headless runs
    void setModelPrompt(ModelPrompt prompt) { m_modelPrompt = std::move(prompt); }

    RegionSelector *regionSelector() const { return m_regionSelector; }
    NeoCR::EscapeHotkeyListener *escapeListener() const { return m_escapeListener; }

    static NeoCR::CLI::CLIResult::Code codeForStage(OCRPipeline::Stage stage);

    // OCR text framed for standard output
    static QString formatResult(const QString &text);

public slots:
    void start();

signals:
    void finished(const NeoCR::CLI::CLIResult &result);

private slots:
    void onRegionSelected(const QRect &globalRegion);
    void onSelectionCancelled();
    void onModelChangeRequested();
    void onOCRCompleted(const QString &text);
    void onOCRFailed(OCRPipeline::Stage stage, const QString &message);

private:
    void startRegionSelection();
    void showModelSelector();
    QString promptWithDialog() const;
    void finish(const NeoCR::CLI::CLIResult &result);

    QString m_model;
    QString m_serverUrl;
    QString m_language;
    bool m_selectModelFirst;
    bool m_finished = false;
    ModelPrompt m_modelPrompt;

    QPointer<RegionSelector> m_regionSelector;
    QScreen *m_targetScreen = nullptr;
    NeoCR::EscapeHotkeyListener *m_escapeListener;
    ICaptureEngine *m_captureEngine;
    IOCRBackend *m_backend;
    ClipboardWriter *m_clipboard;
    DesktopNotifier *m_notifier;
    OCRPipeline *m_pipeline;
};

#endif // NEOCRAPPLICATION_H
