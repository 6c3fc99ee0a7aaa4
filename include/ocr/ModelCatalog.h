#ifndef MODELCATALOG_H
#define MODELCATALOG_H

#include <QObject>
#include <QSet>
#include <QString>
#include <QStringList>

class QNetworkAccessManager;
class QNetworkReply;

/**
 * @brief Fetches the vision-capable models installed on an Ollama server.
 *
 * Queries /api/tags, then /api/show for each model whose name alone does
 * not decide it. The catalog never fails outward: any error yields the
 * built-in model list through modelsReady().
 */
class ModelCatalog : public QObject
{
    Q_OBJECT

public:
    explicit ModelCatalog(QObject* parent = nullptr);
    ~ModelCatalog() override;

    /**
     * @brief Start fetching the model list.
     * @param baseUrl Ollama base URL, e.g. "http://localhost:11434".
     */
    void fetch(const QString& baseUrl);

    bool isFetching() const;

    /**
     * @brief Extract model names from an /api/tags reply body.
     * @param ok Set to false when the body is not the expected JSON shape.
     */
    static QStringList parseTagsResponse(const QByteArray& data, bool* ok = nullptr);

    /**
     * @brief De-duplicate and sort names; empty input yields the built-in list.
     */
    static QStringList finalizeModels(const QStringList& models);

signals:
    void fetchStarted();

    /**
     * @brief Emitted exactly once per fetch() with a non-empty list.
     */
    void modelsReady(const QStringList& models);

private:
    void onTagsReply(QNetworkReply* reply);
    void requestDetails(const QString& modelName);
    void onShowReply(QNetworkReply* reply, const QString& modelName);
    void finishIfDone();
    void finishWithFallback(const QString& reason);

    QNetworkAccessManager* m_networkManager;
    QString m_baseUrl;
    QSet<QString> m_found;
    int m_pendingDetails;
    bool m_isFetching;
};

#endif // MODELCATALOG_H
