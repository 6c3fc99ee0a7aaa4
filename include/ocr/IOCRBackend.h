#ifndef IOCRBACKEND_H
#define IOCRBACKEND_H

#include <QObject>
#include <QString>
#include <functional>

// Callback type for async OCR results
using OCRCallback = std::function<void(bool success, const QString &text, const QString &error)>;

struct OCRRequest {
    QString imagePath;
    QString model;
    QString format = QStringLiteral("markdown");
    QString instruction = QStringLiteral("Extract the exact text in the image and output only the text.");
    QString language = QStringLiteral("English");

    bool isValid() const { return !imagePath.isEmpty() && !model.isEmpty(); }
};

/**
 * @brief Abstract interface for OCR backends
 *
 * Recognition is async; the callback is invoked exactly once on the
 * thread that called recognize().
 */
class IOCRBackend : public QObject
{
    Q_OBJECT

public:
    explicit IOCRBackend(QObject *parent = nullptr) : QObject(parent) {}
    virtual ~IOCRBackend() = default;

    virtual void recognize(const OCRRequest &request, const OCRCallback &callback) = 0;

    virtual QString backendName() const = 0;
};

#endif // IOCRBACKEND_H
