#include <QApplication>
#include <QTextStream>
#include <QTimer>
#include <QDebug>

#include "NeoCRApplication.h"
#include "cli/CLIHandler.h"
#include "settings/Settings.h"
#include "version.h"

using NeoCR::CLI::CLIHandler;
using NeoCR::CLI::CLIResult;

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    // Dialogs and the selector close before the run is over
    app.setQuitOnLastWindowClosed(false);

    app.setApplicationName(NEOCR_APP_NAME);
    app.setOrganizationName(NeoCR::kOrganizationName);
    app.setApplicationVersion(NEOCR_VERSION);

    NeoCR::CLI::RunOptions options;
    const CLIResult parsed = CLIHandler::process(app.arguments(), &options);
    if (!parsed.isSuccess()) {
        QTextStream(stderr) << parsed.message << "\n";
        return parsed.exitCode();
    }
    if (options.exitRequested) {
        QTextStream(stdout) << parsed.message << "\n";
        return 0;
    }

    NeoCRApplication neocr(options);
    QObject::connect(&neocr, &NeoCRApplication::finished, &app, [&app](const CLIResult &result) {
        if (!result.isSuccess()) {
            qCritical().noquote() << result.message;
        } else if (result.cancelled) {
            QTextStream(stdout) << result.message << "\n";
        } else {
            qDebug().noquote() << result.message;
        }
        app.exit(result.exitCode());
    }, Qt::QueuedConnection);

    QTimer::singleShot(0, &neocr, &NeoCRApplication::start);

    return app.exec();
}
