#include "HttpServer.h"
#include "Logging.h"

#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QMimeDatabase>
#include <QTcpSocket>
#include <QUrl>

namespace {
constexpr qint64 kFileChunkSize = 256 * 1024;
}

HttpConnection::HttpConnection(QTcpSocket* socket, qint64 maxBodyBytes, QObject* parent)
    : QObject(parent)
    , m_socket(socket)
    , m_request(maxBodyBytes)
{
    socket->setParent(this);
    connect(socket, &QTcpSocket::readyRead, this, &HttpConnection::onReadyRead);
    connect(socket, &QTcpSocket::bytesWritten, this, &HttpConnection::onBytesWritten);
    connect(socket, &QTcpSocket::disconnected, this, &HttpConnection::onDisconnected);
}

HttpConnection::~HttpConnection() = default;

QByteArray HttpConnection::statusText(int status) {
    switch (status) {
    case 100: return "Continue";
    case 200: return "OK";
    case 204: return "No Content";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 411: return "Length Required";
    case 413: return "Payload Too Large";
    case 431: return "Request Header Fields Too Large";
    case 500: return "Internal Server Error";
    case 503: return "Service Unavailable";
    default: return "Unknown";
    }
}

HttpHeaders HttpConnection::corsHeaders() {
    return {
        {"Access-Control-Allow-Origin", "*"},
        {"Cross-Origin-Opener-Policy", "same-origin"},
        {"Cross-Origin-Embedder-Policy", "require-corp"},
        {"Cross-Origin-Resource-Policy", "cross-origin"},
    };
}

void HttpConnection::onReadyRead() {
    if (!m_socket) return;
    const QByteArray data = m_socket->readAll();
    if (m_responded) return;

    const HttpRequest::State state = m_request.feed(data);
    if (state == HttpRequest::State::Error) {
        qCWarning(REELFORGE_SERVER_LOG) << "Rejected request:" << m_request.errorString();
        sendText(m_request.errorStatus(), m_request.errorString());
        return;
    }
    if (state == HttpRequest::State::ReadingBody && m_request.expectsContinue() && !m_continueSent) {
        m_continueSent = true;
        m_socket->write("HTTP/1.1 100 Continue\r\n\r\n");
    }
    if (state == HttpRequest::State::Complete) {
        emit requestReady(this);
    }
}

void HttpConnection::writeHead(int status, const HttpHeaders& headers) {
    QByteArray head = "HTTP/1.1 " + QByteArray::number(status) + ' ' + statusText(status) + "\r\n";
    for (const auto& h : corsHeaders()) {
        head += h.first + ": " + h.second + "\r\n";
    }
    for (const auto& h : headers) {
        head += h.first + ": " + h.second + "\r\n";
    }
    head += "Connection: close\r\n\r\n";
    m_socket->write(head);
}

void HttpConnection::sendResponse(int status, const QByteArray& contentType, const QByteArray& body,
                                  const HttpHeaders& extraHeaders) {
    if (m_responded || !m_socket) return;

    HttpHeaders headers = extraHeaders;
    if (!contentType.isEmpty()) headers.append({"Content-Type", contentType});
    headers.append({"Content-Length", QByteArray::number(body.size())});

    writeHead(status, headers);
    if (m_request.method() != "HEAD") m_socket->write(body);
    finishResponse();
}

void HttpConnection::sendJson(int status, const QJsonObject& obj) {
    sendResponse(status, "application/json; charset=utf-8",
                 QJsonDocument(obj).toJson(QJsonDocument::Compact));
}

void HttpConnection::sendText(int status, const QString& text) {
    sendResponse(status, "text/plain; charset=utf-8", text.toUtf8());
}

void HttpConnection::sendEmpty(int status, const HttpHeaders& extraHeaders) {
    sendResponse(status, QByteArray(), QByteArray(), extraHeaders);
}

bool HttpConnection::sendFile(const QString& filePath, const QString& downloadName,
                              const QByteArray& disposition) {
    if (m_responded || !m_socket) return false;

    auto file = std::make_unique<QFile>(filePath);
    if (!file->open(QIODevice::ReadOnly)) {
        qCWarning(REELFORGE_SERVER_LOG) << "Cannot open" << filePath << file->errorString();
        return false;
    }

    const QByteArray mime = QMimeDatabase().mimeTypeForFile(filePath, QMimeDatabase::MatchExtension)
                                .name().toUtf8();
    const QString name = headerSafeFileName(downloadName.isEmpty() ? QFileInfo(filePath).fileName()
                                                                   : downloadName);

    HttpHeaders headers = {
        {"Content-Type", mime},
        {"Content-Length", QByteArray::number(file->size())},
        {"Content-Disposition", disposition + "; filename=\"" + name.toUtf8() + "\""},
    };
    writeHead(200, headers);
    if (m_request.method() == "HEAD") {
        finishResponse();
        return true;
    }
    m_responded = true;
    m_file = std::move(file);
    onBytesWritten();
    return true;
}

QString HttpConnection::headerSafeFileName(const QString& name) {
    QString out;
    out.reserve(name.size());
    for (const QChar ch : name) {
        // Control characters would end the header line
        if (ch.unicode() < 0x20 || ch.unicode() == 0x7f) continue;
        out += (ch == '"' || ch == '\\') ? QChar('_') : ch;
    }
    return out;
}

void HttpConnection::onBytesWritten() {
    if (!m_file || !m_socket) return;

    // Keep at most one chunk queued on the socket
    if (m_socket->bytesToWrite() >= kFileChunkSize) return;

    if (m_file->atEnd()) {
        m_file.reset();
        finishResponse();
        return;
    }
    const QByteArray chunk = m_file->read(kFileChunkSize);
    if (chunk.isEmpty()) {
        qCWarning(REELFORGE_SERVER_LOG) << "Read error while sending" << m_file->fileName();
        m_file.reset();
        m_socket->abort();
        return;
    }
    m_socket->write(chunk);
}

void HttpConnection::startEventStream() {
    if (m_responded || !m_socket) return;
    writeHead(200, {
        {"Content-Type", "text/event-stream"},
        {"Cache-Control", "no-cache"},
    });
    m_responded = true;
    m_streaming = true;
}

void HttpConnection::sendEvent(const QByteArray& payload) {
    if (!m_streaming || !m_socket) return;
    m_socket->write("data: " + payload + "\n\n");
}

void HttpConnection::endEventStream() {
    if (!m_streaming) return;
    m_streaming = false;
    finishResponse();
}

void HttpConnection::finishResponse() {
    m_responded = true;
    if (m_socket) m_socket->disconnectFromHost();
}

void HttpConnection::onDisconnected() {
    m_file.reset();
    m_streaming = false;
    emit closed();
    deleteLater();
}

HttpServer::HttpServer(qint64 maxBodyBytes, QObject* parent)
    : QObject(parent)
    , m_maxBodyBytes(maxBodyBytes)
{
    connect(&m_server, &QTcpServer::newConnection, this, &HttpServer::onNewConnection);
}

void HttpServer::route(const QByteArray& method, const QString& pattern, Handler handler) {
    m_routes.push_back({method.toUpper(), pattern, std::move(handler)});
}

bool HttpServer::listen(const QHostAddress& address, quint16 port) {
    if (!m_server.listen(address, port)) {
        m_error = QString("Cannot listen on %1:%2: %3")
                      .arg(address.toString()).arg(port).arg(m_server.errorString());
        return false;
    }
    qCInfo(REELFORGE_SERVER_LOG) << "Listening on" << address.toString() << m_server.serverPort();
    return true;
}

void HttpServer::close() {
    m_server.close();
}

bool HttpServer::matchRoute(const QString& pattern, const QString& path, RouteParams& params) {
    const QStringList want = pattern.split('/', Qt::SkipEmptyParts);
    const QStringList have = path.split('/', Qt::SkipEmptyParts);
    if (want.size() != have.size()) return false;

    RouteParams found;
    for (int i = 0; i < want.size(); ++i) {
        if (want[i].startsWith(':')) {
            found.insert(want[i].mid(1), have[i]);
        } else if (want[i] != have[i]) {
            return false;
        }
    }
    params = found;
    return true;
}

void HttpServer::onNewConnection() {
    while (m_server.hasPendingConnections()) {
        QTcpSocket* socket = m_server.nextPendingConnection();
        auto* connection = new HttpConnection(socket, m_maxBodyBytes, this);
        connect(connection, &HttpConnection::requestReady, this, &HttpServer::dispatch);
    }
}

void HttpServer::dispatch(HttpConnection* connection) {
    const HttpRequest& request = connection->request();
    const QByteArray method = request.method();
    const QString path = request.path();

    qCInfo(REELFORGE_SERVER_LOG) << method.constData() << path;

    if (method == "OPTIONS") {
        connection->sendEmpty(204, {
            {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
            {"Access-Control-Allow-Headers", "Content-Type"},
        });
        return;
    }

    const QByteArray effective = method == "HEAD" ? QByteArray("GET") : method;
    for (const auto& route : m_routes) {
        RouteParams params;
        if (route.method == effective && matchRoute(route.pattern, path, params)) {
            route.handler(*connection, params);
            return;
        }
    }
    connection->sendText(404, QString("Cannot %1 %2").arg(QString::fromLatin1(method), path));
}
