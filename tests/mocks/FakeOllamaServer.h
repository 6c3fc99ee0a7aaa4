#ifndef FAKEOLLAMASERVER_H
#define FAKEOLLAMASERVER_H

#include <QByteArray>
#include <QHash>
#include <QList>
#include <QObject>
#include <QString>
#include <QTcpServer>

class QTcpSocket;

/**
 * @brief Minimal HTTP/1.1 server answering canned Ollama API replies
 *
 * One request per connection, replies carry "Connection: close".
 * Unknown routes answer 404 with an Ollama-style error body.
 */
class FakeOllamaServer : public QObject
{
    Q_OBJECT

public:
    struct Request {
        QByteArray method;
        QByteArray path;
        QByteArray body;
    };

    explicit FakeOllamaServer(QObject *parent = nullptr);

    bool listen();
    QString baseUrl() const;

    void setResponse(const QByteArray &method, const QByteArray &path,
                     int status, const QByteArray &body);

    // /api/show replies keyed by the requested model name
    void setShowResponse(const QString &model, int status, const QByteArray &body);

    QList<Request> requests() const { return m_requests; }
    QStringList showRequests() const;

private:
    struct Response {
        int status = 200;
        QByteArray body;
    };

    void onNewConnection();
    void onReadyRead(QTcpSocket *socket);
    Response responseFor(const Request &request) const;
    static QByteArray reasonPhrase(int status);

    QTcpServer m_server;
    QHash<QByteArray, Response> m_responses;
    QHash<QString, Response> m_showResponses;
    QHash<QTcpSocket *, QByteArray> m_buffers;
    QList<Request> m_requests;
};

#endif // FAKEOLLAMASERVER_H
