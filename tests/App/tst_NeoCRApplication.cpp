#include <QtTest>
#include <QPushButton>

#include "NeoCRApplication.h"
#include "RegionSelector.h"
#include "SelectionControlBar.h"
#include "hotkey/EscapeHotkeyListener.h"
#include "settings/ModelSettingsManager.h"
#include "settings/Settings.h"

using NeoCR::CLI::CLIResult;
using NeoCR::CLI::RunOptions;

class tst_NeoCRApplication : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanup();

    void testCodeForStage_MapsEveryStage();
    void testFormatResult_FramesText();

    void testOptions_DefaultToStoredSettings();
    void testOptions_OverrideStoredSettings();
    void testOptions_HostTrailingSlashesStripped();
    void testOptions_OverridesAreNotPersisted();

    void testStart_SelectModelFirstCancelled();
    void testStart_SelectModelFirstOpensSelector();
    void testChangeModel_PersistsAndReopensIdleSelector();
    void testChangeModel_CancelledPromptCancelsRun();
    void testEscapeHotkey_CancelsSelectionOnce();

private:
    static CLIResult resultAt(const QSignalSpy &spy, int index);
};

void tst_NeoCRApplication::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
    qRegisterMetaType<CLIResult>();
}

CLIResult tst_NeoCRApplication::resultAt(const QSignalSpy &spy, int index)
{
    return spy.at(index).at(0).value<CLIResult>();
}

void tst_NeoCRApplication::cleanup()
{
    auto settings = NeoCR::getSettings();
    settings.remove(NeoCR::kSettingsKeyLastModel);
    settings.remove(NeoCR::kSettingsKeyOllamaUrl);
    settings.remove(NeoCR::kSettingsKeyLanguage);
    settings.sync();
    ModelSettingsManager::instance().load();
}

void tst_NeoCRApplication::testCodeForStage_MapsEveryStage()
{
    QCOMPARE(NeoCRApplication::codeForStage(OCRPipeline::Stage::Capture), CLIResult::Code::CaptureError);
    QCOMPARE(NeoCRApplication::codeForStage(OCRPipeline::Stage::Recognition), CLIResult::Code::OCRError);
    QCOMPARE(NeoCRApplication::codeForStage(OCRPipeline::Stage::Clipboard), CLIResult::Code::ClipboardError);
}

void tst_NeoCRApplication::testFormatResult_FramesText()
{
    const QString rule(50, QLatin1Char('='));
    QCOMPARE(NeoCRApplication::formatResult("Hello"),
             rule + "\nOCR Result (also copied to clipboard):\n" + rule + "\nHello\n" + rule + "\n");
}

void tst_NeoCRApplication::testOptions_DefaultToStoredSettings()
{
    auto &settings = ModelSettingsManager::instance();
    settings.setLastModel("llava:13b");
    settings.setOllamaUrl("http://gpu-box:11434");
    settings.setLanguage("Korean");

    NeoCRApplication app{RunOptions()};
    QCOMPARE(app.model(), QString("llava:13b"));
    QCOMPARE(app.serverUrl(), QString("http://gpu-box:11434"));
    QCOMPARE(app.language(), QString("Korean"));
}

void tst_NeoCRApplication::testOptions_OverrideStoredSettings()
{
    ModelSettingsManager::instance().setLastModel("llava:13b");

    RunOptions options;
    options.model = "gemma3:12b";
    options.host = "https://ollama.example.org";
    options.language = "Spanish";

    NeoCRApplication app(options);
    QCOMPARE(app.model(), QString("gemma3:12b"));
    QCOMPARE(app.serverUrl(), QString("https://ollama.example.org"));
    QCOMPARE(app.language(), QString("Spanish"));
}

void tst_NeoCRApplication::testOptions_HostTrailingSlashesStripped()
{
    RunOptions options;
    options.host = "http://localhost:11434//";

    NeoCRApplication app(options);
    QCOMPARE(app.serverUrl(), QString("http://localhost:11434"));
}

void tst_NeoCRApplication::testOptions_OverridesAreNotPersisted()
{
    ModelSettingsManager::instance().setLastModel("llava:13b");

    RunOptions options;
    options.model = "gemma3:12b";
    NeoCRApplication app(options);

    QCOMPARE(ModelSettingsManager::instance().lastModel(), QString("llava:13b"));
}

void tst_NeoCRApplication::testStart_SelectModelFirstCancelled()
{
    RunOptions options;
    options.selectModel = true;
    NeoCRApplication app(options);

    int promptCalls = 0;
    app.setModelPrompt([&promptCalls](const QString &) {
        ++promptCalls;
        return QString();
    });

    QSignalSpy finishedSpy(&app, &NeoCRApplication::finished);
    app.start();

    QCOMPARE(promptCalls, 1);
    QCOMPARE(finishedSpy.count(), 1);
    const CLIResult result = resultAt(finishedSpy, 0);
    QVERIFY(result.cancelled);
    QCOMPARE(result.exitCode(), 0);
    QVERIFY(app.regionSelector() == nullptr);
}

void tst_NeoCRApplication::testStart_SelectModelFirstOpensSelector()
{
    RunOptions options;
    options.selectModel = true;
    options.model = "llava:7b";
    NeoCRApplication app(options);
    app.setModelPrompt([](const QString &) { return QString("qwen2.5vl:7b"); });

    QSignalSpy finishedSpy(&app, &NeoCRApplication::finished);
    app.start();

    QCOMPARE(app.model(), QString("qwen2.5vl:7b"));
    QCOMPARE(ModelSettingsManager::instance().lastModel(), QString("qwen2.5vl:7b"));
    QVERIFY(app.regionSelector() != nullptr);
    QVERIFY(app.regionSelector()->isVisible());
    QCOMPARE(finishedSpy.count(), 0);
}

void tst_NeoCRApplication::testChangeModel_PersistsAndReopensIdleSelector()
{
    RunOptions options;
    options.model = "llava:7b";
    NeoCRApplication app(options);

    QStringList promptedWith;
    app.setModelPrompt([&promptedWith](const QString &current) {
        promptedWith << current;
        return QString("gemma3:12b");
    });

    QSignalSpy finishedSpy(&app, &NeoCRApplication::finished);
    app.start();

    QPointer<RegionSelector> first = app.regionSelector();
    QVERIFY(first);
    first->controlBar()->changeModelButton()->click();

    QTRY_COMPARE(promptedWith.size(), 1);
    QCOMPARE(promptedWith.first(), QString("llava:7b"));
    QTRY_VERIFY(first.isNull());

    RegionSelector *second = app.regionSelector();
    QVERIFY(second != nullptr);
    QVERIFY(second->isVisible());
    QCOMPARE(second->selectionManager()->state(), SelectionStateManager::State::Idle);
    QCOMPARE(second->controlBar()->changeModelButton()->text(),
             SelectionControlBar::changeModelLabel("gemma3:12b"));

    QCOMPARE(app.model(), QString("gemma3:12b"));
    QCOMPARE(NeoCR::getSettings().value(NeoCR::kSettingsKeyLastModel).toString(), QString("gemma3:12b"));
    QCOMPARE(finishedSpy.count(), 0);
}

void tst_NeoCRApplication::testChangeModel_CancelledPromptCancelsRun()
{
    ModelSettingsManager::instance().setLastModel("llava:7b");

    NeoCRApplication app{RunOptions()};
    app.setModelPrompt([](const QString &) { return QString(); });

    QSignalSpy finishedSpy(&app, &NeoCRApplication::finished);
    app.start();

    QPointer<RegionSelector> selector = app.regionSelector();
    QVERIFY(selector);
    selector->controlBar()->changeModelButton()->click();

    QTRY_COMPARE(finishedSpy.count(), 1);
    const CLIResult result = resultAt(finishedSpy, 0);
    QVERIFY(result.cancelled);
    QCOMPARE(result.exitCode(), 0);

    QTRY_VERIFY(selector.isNull());
    QTest::qWait(50);
    QCOMPARE(finishedSpy.count(), 1);
    QCOMPARE(app.model(), QString("llava:7b"));
    QCOMPARE(ModelSettingsManager::instance().lastModel(), QString("llava:7b"));
}

void tst_NeoCRApplication::testEscapeHotkey_CancelsSelectionOnce()
{
    NeoCRApplication app{RunOptions()};
    QSignalSpy finishedSpy(&app, &NeoCRApplication::finished);
    app.start();

    QPointer<RegionSelector> selector = app.regionSelector();
    QVERIFY(selector);

    // Repeated presses queue up before the first one is handled
    emit app.escapeListener()->escapePressed();
    emit app.escapeListener()->escapePressed();
    QCOMPARE(finishedSpy.count(), 0);

    QTRY_COMPARE(finishedSpy.count(), 1);
    QVERIFY(resultAt(finishedSpy, 0).cancelled);
    QCOMPARE(resultAt(finishedSpy, 0).exitCode(), 0);

    QTRY_VERIFY(selector.isNull());
    QTest::qWait(50);
    QCOMPARE(finishedSpy.count(), 1);
}

QTEST_MAIN(tst_NeoCRApplication)
#include "tst_NeoCRApplication.moc"
