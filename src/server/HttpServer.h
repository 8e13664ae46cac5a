#pragma once

#include <QObject>
#include <QByteArray>
#include <QHash>
#include <QHostAddress>
#include <QJsonObject>
#include <QList>
#include <QPair>
#include <QPointer>
#include <QString>
#include <QTcpServer>
#include <functional>
#include <memory>
#include <vector>
#include "HttpRequest.h"

class QFile;
class QTcpSocket;

using HttpHeaders = QList<QPair<QByteArray, QByteArray>>;
using RouteParams = QHash<QString, QString>;

// One client connection carrying one request and one response. Deletes
// itself once the socket is gone.
class HttpConnection : public QObject {
    Q_OBJECT
public:
    HttpConnection(QTcpSocket* socket, qint64 maxBodyBytes, QObject* parent = nullptr);
    ~HttpConnection() override;

    const HttpRequest& request() const { return m_request; }

    void sendResponse(int status, const QByteArray& contentType, const QByteArray& body,
                      const HttpHeaders& extraHeaders = {});
    void sendJson(int status, const QJsonObject& obj);
    void sendText(int status, const QString& text);
    void sendEmpty(int status, const HttpHeaders& extraHeaders = {});

    // Streams a file; disposition is "inline" or "attachment"
    bool sendFile(const QString& filePath, const QString& downloadName, const QByteArray& disposition);

    // Server-sent events: headers once, then "data: <payload>\n\n" frames
    void startEventStream();
    void sendEvent(const QByteArray& payload);
    void endEventStream();

    // Drops control characters and replaces quotes for a quoted-string parameter
    static QString headerSafeFileName(const QString& name);
    static QByteArray statusText(int status);
    static HttpHeaders corsHeaders();

signals:
    void requestReady(HttpConnection* connection);
    void closed();

private slots:
    void onReadyRead();
    void onBytesWritten();
    void onDisconnected();

private:
    void writeHead(int status, const HttpHeaders& headers);
    void finishResponse();

    QPointer<QTcpSocket> m_socket;
    HttpRequest m_request;
    std::unique_ptr<QFile> m_file;
    bool m_continueSent = false;
    bool m_responded = false;
    bool m_streaming = false;
};

class HttpServer : public QObject {
    Q_OBJECT
public:
    using Handler = std::function<void(HttpConnection&, const RouteParams&)>;

    explicit HttpServer(qint64 maxBodyBytes = AppConstants::DefaultMaxBodyBytes, QObject* parent = nullptr);

    // Patterns are literal segments and ":name" parameters, e.g. /download/:jobId
    void route(const QByteArray& method, const QString& pattern, Handler handler);

    bool listen(const QHostAddress& address, quint16 port);
    quint16 serverPort() const { return m_server.serverPort(); }
    void close();
    QString errorString() const { return m_error; }

    static bool matchRoute(const QString& pattern, const QString& path, RouteParams& params);

private slots:
    void onNewConnection();
    void dispatch(HttpConnection* connection);

private:
    struct Route {
        QByteArray method;
        QString pattern;
        Handler handler;
    };

    QTcpServer m_server;
    std::vector<Route> m_routes;
    qint64 m_maxBodyBytes;
    QString m_error;
};
