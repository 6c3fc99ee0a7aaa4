#ifndef OLLAMAOCRBACKEND_H
#define OLLAMAOCRBACKEND_H

#include "ocr/IOCRBackend.h"

#include <QByteArray>

class QNetworkAccessManager;

/**
 * @brief OCR through a vision model served by Ollama (/api/generate).
 */
class OllamaOCRBackend : public IOCRBackend
{
    Q_OBJECT

public:
    explicit OllamaOCRBackend(const QString &baseUrl, QObject *parent = nullptr);
    ~OllamaOCRBackend() override;

    void recognize(const OCRRequest &request, const OCRCallback &callback) override;
    QString backendName() const override { return QStringLiteral("Ollama"); }

    QString baseUrl() const { return m_baseUrl; }

    static QString buildPrompt(const OCRRequest &request);

    // Non-streaming generate body; imageBase64 is already encoded
    static QByteArray buildRequestBody(const OCRRequest &request, const QByteArray &imageBase64);

    /**
     * @brief Extract the recognized text from a /api/generate reply body.
     * @return true on success; errorMessage is set on failure
     */
    static bool parseResponse(const QByteArray &data, QString *text, QString *errorMessage);

private:
    QNetworkAccessManager *m_networkManager;
    QString m_baseUrl;
};

#endif // OLLAMAOCRBACKEND_H
