#include "cli/CLIHandler.h"
#include "version.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QUrl>

namespace NeoCR {
namespace CLI {

CLIResult CLIHandler::process(const QStringList& arguments, RunOptions* options)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Select a screen region and copy its text, recognized by a local Ollama vision model."));
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption versionOption = parser.addVersionOption();

    const QCommandLineOption modelOption(
        {QStringLiteral("m"), QStringLiteral("model")},
        QStringLiteral("Vision model to use for this run."),
        QStringLiteral("name"));
    const QCommandLineOption selectModelOption(
        {QStringLiteral("s"), QStringLiteral("select-model")},
        QStringLiteral("Choose the model before selecting a region."));
    const QCommandLineOption hostOption(
        QStringLiteral("host"),
        QStringLiteral("Ollama base URL for this run."),
        QStringLiteral("url"));
    const QCommandLineOption languageOption(
        {QStringLiteral("l"), QStringLiteral("language")},
        QStringLiteral("Language of the text in the region."),
        QStringLiteral("name"));

    parser.addOption(modelOption);
    parser.addOption(selectModelOption);
    parser.addOption(hostOption);
    parser.addOption(languageOption);

    if (!parser.parse(arguments)) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, parser.errorText());
    }

    if (parser.isSet(helpOption)) {
        options->exitRequested = true;
        return CLIResult::success(parser.helpText());
    }
    if (parser.isSet(versionOption)) {
        options->exitRequested = true;
        return CLIResult::success(getVersionText());
    }

    if (!parser.positionalArguments().isEmpty()) {
        return CLIResult::error(
            CLIResult::Code::InvalidArguments,
            QStringLiteral("Unexpected argument: %1").arg(parser.positionalArguments().first()));
    }

    if (parser.isSet(modelOption)) {
        options->model = parser.value(modelOption).trimmed();
        if (options->model.isEmpty()) {
            return CLIResult::error(CLIResult::Code::InvalidArguments,
                                    QStringLiteral("Model name must not be empty"));
        }
    }

    if (parser.isSet(hostOption)) {
        const QUrl url(parser.value(hostOption).trimmed(), QUrl::StrictMode);
        if (!url.isValid() || url.host().isEmpty() ||
            (url.scheme() != QLatin1String("http") && url.scheme() != QLatin1String("https"))) {
            return CLIResult::error(
                CLIResult::Code::InvalidArguments,
                QStringLiteral("Invalid host URL: %1").arg(parser.value(hostOption)));
        }
        options->host = parser.value(hostOption).trimmed();
    }

    if (parser.isSet(languageOption)) {
        options->language = parser.value(languageOption).trimmed();
    }

    options->selectModel = parser.isSet(selectModelOption);
    return CLIResult::success();
}

QString CLIHandler::getVersionText() { return QString("%1 version %2").arg(NEOCR_APP_NAME, NEOCR_VERSION); }

} // namespace CLI
} // namespace NeoCR
