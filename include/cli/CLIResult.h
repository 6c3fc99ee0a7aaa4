#ifndef CLI_RESULT_H
#define CLI_RESULT_H

#include <QMetaType>
#include <QString>

namespace NeoCR {
namespace CLI {

/**
 * @brief Outcome of one neocr run, mapped to the process exit code
 */
struct CLIResult
{
    enum class Code {
        Success = 0,
        GeneralError = 1,
        InvalidArguments = 2,
        CaptureError = 3,
        OCRError = 4,
        ClipboardError = 5,
    };

    Code code = Code::Success;
    QString message;
    bool cancelled = false;

    bool isSuccess() const { return code == Code::Success; }
    int exitCode() const { return static_cast<int>(code); }

    static CLIResult success(const QString& msg = QString())
    {
        return {Code::Success, msg, false};
    }

    // User cancellation is not an error
    static CLIResult cancellation() { return {Code::Success, QStringLiteral("Selection cancelled."), true}; }

    static CLIResult error(Code code, const QString& msg) { return {code, msg, false}; }
};

} // namespace CLI
} // namespace NeoCR

Q_DECLARE_METATYPE(NeoCR::CLI::CLIResult)

#endif // CLI_RESULT_H
