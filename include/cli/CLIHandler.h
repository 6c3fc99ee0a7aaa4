#ifndef CLI_HANDLER_H
#define CLI_HANDLER_H

#include "CLIResult.h"

#include <QString>
#include <QStringList>

namespace NeoCR {
namespace CLI {

/**
 * @brief Options for one run; empty strings mean "use the stored setting"
 */
struct RunOptions
{
    QString model;
    QString host;
    QString language;
    bool selectModel = false;

    // Help or version was printed, nothing else to do
    bool exitRequested = false;
};

/**
 * @brief Command line parsing for the neocr executable
 */
class CLIHandler
{
public:
    /**
     * @brief Parse the command line
     * @param arguments Command line arguments (including program name)
     * @param options Filled with the parsed values
     * @return Success, possibly carrying help/version text to print,
     *         or InvalidArguments with the parser error
     */
    static CLIResult process(const QStringList& arguments, RunOptions* options);

    static QString getVersionText();
};

} // namespace CLI
} // namespace NeoCR

#endif // CLI_HANDLER_H
