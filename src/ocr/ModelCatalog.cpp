#include "ocr/ModelCatalog.h"
#include "ocr/VisionModelClassifier.h"
#include "Constants.h"

#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <QNetworkReply>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include <QUrl>
#include <QDebug>

#include <algorithm>

ModelCatalog::ModelCatalog(QObject* parent)
    : QObject(parent)
    , m_networkManager(new QNetworkAccessManager(this))
    , m_pendingDetails(0)
    , m_isFetching(false)
{
}

ModelCatalog::~ModelCatalog() = default;

void ModelCatalog::fetch(const QString& baseUrl)
{
    if (m_isFetching) {
        qDebug() << "ModelCatalog: Fetch already in progress";
        return;
    }

    m_isFetching = true;
    m_baseUrl = baseUrl;
    m_found.clear();
    m_pendingDetails = 0;
    emit fetchStarted();

    QNetworkRequest request(QUrl(m_baseUrl + QStringLiteral("/api/tags")));
    request.setTransferTimeout(NeoCR::Timeout::kModelListRequest);

    qDebug() << "ModelCatalog: Fetching models from" << request.url().toString();
    QNetworkReply* reply = m_networkManager->get(request);
    connect(reply, &QNetworkReply::finished, this, [this, reply]() {
        onTagsReply(reply);
    });
}

bool ModelCatalog::isFetching() const
{
    return m_isFetching;
}

QStringList ModelCatalog::parseTagsResponse(const QByteArray& data, bool* ok)
{
    if (ok) {
        *ok = false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return {};
    }

    const QJsonValue modelsValue = doc.object().value(QStringLiteral("models"));
    if (!modelsValue.isArray()) {
        return {};
    }

    QStringList names;
    const QJsonArray models = modelsValue.toArray();
    for (const QJsonValue& entry : models) {
        const QString name = entry.toObject().value(QStringLiteral("name")).toString();
        if (!name.isEmpty()) {
            names.append(name);
        }
    }

    if (ok) {
        *ok = true;
    }
    return names;
}

QStringList ModelCatalog::finalizeModels(const QStringList& models)
{
    QStringList result = models;
    result.removeDuplicates();
    std::sort(result.begin(), result.end());

    if (result.isEmpty()) {
        return VisionModelClassifier::defaultVisionModels();
    }
    return result;
}

void ModelCatalog::onTagsReply(QNetworkReply* reply)
{
    reply->deleteLater();

    if (reply->error() != QNetworkReply::NoError) {
        finishWithFallback(reply->errorString());
        return;
    }

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status != 200) {
        finishWithFallback(QStringLiteral("HTTP status %1").arg(status));
        return;
    }

    bool ok = false;
    const QStringList names = parseTagsResponse(reply->readAll(), &ok);
    if (!ok) {
        finishWithFallback(QStringLiteral("Malformed model list"));
        return;
    }

    for (const QString& name : names) {
        switch (VisionModelClassifier::classifyName(name)) {
        case VisionModelClassifier::NameClass::Vision:
            m_found.insert(name);
            break;
        case VisionModelClassifier::NameClass::Excluded:
            break;
        case VisionModelClassifier::NameClass::NeedsDetails:
            requestDetails(name);
            break;
        }
    }

    finishIfDone();
}

void ModelCatalog::requestDetails(const QString& modelName)
{
    QNetworkRequest request(QUrl(m_baseUrl + QStringLiteral("/api/show")));
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    request.setTransferTimeout(NeoCR::Timeout::kModelListRequest);

    QJsonObject body;
    body[QStringLiteral("name")] = modelName;

    ++m_pendingDetails;
    QNetworkReply* reply = m_networkManager->post(request, QJsonDocument(body).toJson(QJsonDocument::Compact));
    connect(reply, &QNetworkReply::finished, this, [this, reply, modelName]() {
        onShowReply(reply, modelName);
    });
}

void ModelCatalog::onShowReply(QNetworkReply* reply, const QString& modelName)
{
    reply->deleteLater();
    --m_pendingDetails;

    if (reply->error() != QNetworkReply::NoError) {
        qDebug() << "ModelCatalog: Skipping" << modelName << "-" << reply->errorString();
    } else {
        const QJsonDocument doc = QJsonDocument::fromJson(reply->readAll());
        if (doc.isObject() && VisionModelClassifier::detailsIndicateVision(modelName, doc.object())) {
            m_found.insert(modelName);
        }
    }

    finishIfDone();
}

void ModelCatalog::finishIfDone()
{
    if (!m_isFetching || m_pendingDetails > 0) {
        return;
    }

    m_isFetching = false;
    const QStringList models = finalizeModels(QStringList(m_found.begin(), m_found.end()));
    qDebug() << "ModelCatalog: Found" << models.size() << "vision models";
    emit modelsReady(models);
}

void ModelCatalog::finishWithFallback(const QString& reason)
{
    qWarning() << "ModelCatalog: Could not fetch models:" << reason << "- using built-in list";
    m_isFetching = false;
    emit modelsReady(VisionModelClassifier::defaultVisionModels());
}
