#include "ocr/OllamaOCRBackend.h"
#include "Constants.h"

#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <QNetworkReply>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include <QFile>
#include <QUrl>
#include <QDebug>

OllamaOCRBackend::OllamaOCRBackend(const QString &baseUrl, QObject *parent)
    : IOCRBackend(parent)
    , m_networkManager(new QNetworkAccessManager(this))
    , m_baseUrl(baseUrl)
{
}

OllamaOCRBackend::~OllamaOCRBackend() = default;

QString OllamaOCRBackend::buildPrompt(const OCRRequest &request)
{
    QStringList parts;
    parts << request.instruction.trimmed();

    const QString format = request.format.toLower();
    if (format == QLatin1String("markdown")) {
        parts << QStringLiteral("Format the output as Markdown, preserving headings, lists and tables.");
    } else if (format == QLatin1String("json")) {
        parts << QStringLiteral("Format the output as JSON.");
    } else if (!format.isEmpty() && format != QLatin1String("text")) {
        parts << QStringLiteral("Format the output as %1.").arg(request.format);
    }

    if (!request.language.isEmpty() &&
        request.language.compare(QLatin1String("English"), Qt::CaseInsensitive) != 0) {
        parts << QStringLiteral("The text in the image is written in %1.").arg(request.language);
    }

    return parts.join(QLatin1Char(' '));
}

QByteArray OllamaOCRBackend::buildRequestBody(const OCRRequest &request, const QByteArray &imageBase64)
{
    QJsonObject body;
    body[QStringLiteral("model")] = request.model;
    body[QStringLiteral("prompt")] = buildPrompt(request);
    body[QStringLiteral("images")] = QJsonArray{QString::fromLatin1(imageBase64)};
    body[QStringLiteral("stream")] = false;
    return QJsonDocument(body).toJson(QJsonDocument::Compact);
}

bool OllamaOCRBackend::parseResponse(const QByteArray &data, QString *text, QString *errorMessage)
{
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);

    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Invalid response from OCR service");
        }
        return false;
    }

    const QJsonObject obj = doc.object();
    if (obj.contains(QStringLiteral("error"))) {
        if (errorMessage) {
            *errorMessage = obj.value(QStringLiteral("error")).toString();
        }
        return false;
    }

    const QJsonValue response = obj.value(QStringLiteral("response"));
    if (!response.isString()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("OCR response has no text");
        }
        return false;
    }

    if (text) {
        *text = response.toString().trimmed();
    }
    return true;
}

void OllamaOCRBackend::recognize(const OCRRequest &request, const OCRCallback &callback)
{
    if (!request.isValid()) {
        if (callback) {
            callback(false, QString(), QStringLiteral("Invalid OCR request"));
        }
        return;
    }

    QFile imageFile(request.imagePath);
    if (!imageFile.open(QIODevice::ReadOnly)) {
        qWarning() << "OllamaOCRBackend: Cannot read image" << request.imagePath
                   << imageFile.errorString();
        if (callback) {
            callback(false, QString(), QStringLiteral("Cannot read image: %1").arg(imageFile.errorString()));
        }
        return;
    }
    const QByteArray imageBase64 = imageFile.readAll().toBase64();
    imageFile.close();

    QNetworkRequest networkRequest(QUrl(m_baseUrl + QStringLiteral("/api/generate")));
    networkRequest.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    networkRequest.setTransferTimeout(NeoCR::Timeout::kOCRRequest);

    qDebug() << "OllamaOCRBackend: Sending" << request.imagePath << "to model" << request.model;
    QNetworkReply *reply = m_networkManager->post(networkRequest, buildRequestBody(request, imageBase64));

    connect(reply, &QNetworkReply::finished, this, [reply, callback]() {
        reply->deleteLater();

        const QByteArray data = reply->readAll();
        const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();

        QString text;
        QString errorMessage;
        bool success = false;

        if (reply->error() != QNetworkReply::NoError && status == 0) {
            errorMessage = reply->errorString();
        } else if (!parseResponse(data, &text, &errorMessage)) {
            if (errorMessage.isEmpty()) {
                errorMessage = QStringLiteral("OCR request failed");
            }
        } else if (status != 200) {
            errorMessage = QStringLiteral("OCR service returned HTTP %1").arg(status);
        } else {
            success = true;
        }

        if (!success) {
            qWarning() << "OllamaOCRBackend: Recognition failed:" << errorMessage;
        }
        if (callback) {
            callback(success, text, errorMessage);
        }
    });
}
