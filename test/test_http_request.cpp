#include <cassert>
#include <cstdio>
#include <QCoreApplication>
#include <QDir>
#include <QEventLoop>
#include <QFile>
#include <QHostAddress>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTcpSocket>
#include <QTemporaryDir>
#include <QTimer>
#include "jobs/JobRegistry.h"
#include "server/HttpRequest.h"
#include "server/HttpServer.h"
#include "server/RenderService.h"

void test_incremental_get() {
    HttpRequest::State state;
    HttpRequest request;
    state = request.feed("GET /progress/ab");
    assert(state == HttpRequest::State::ReadingHeaders);
    state = request.feed("c?x=1 HTTP/1.1\r\nHost: local");
    assert(state == HttpRequest::State::ReadingHeaders);
    state = request.feed("host\r\n\r\n");
    assert(state == HttpRequest::State::Complete);

    assert(request.method() == "GET");
    assert(request.path() == "/progress/abc");
    assert(request.query().queryItemValue("x") == "1");
    assert(request.header("HOST") == "localhost");
    assert(request.body().isEmpty());
    printf("PASS: test_incremental_get\n");
}

void test_body_by_content_length() {
    HttpRequest::State state;
    HttpRequest request;
    QByteArray head = "post /export HTTP/1.1\r\nContent-Length: 10\r\n\r\n";
    state = request.feed(head + "01234");
    assert(state == HttpRequest::State::ReadingBody);
    assert(request.headersComplete());
    assert(request.contentLength() == 10);
    // Bytes past the declared length are dropped
    state = request.feed("56789trailing");
    assert(state == HttpRequest::State::Complete);
    assert(request.method() == "POST");
    assert(request.body() == "0123456789");
    printf("PASS: test_body_by_content_length\n");
}

void test_expect_continue() {
    HttpRequest request;
    request.feed("POST /export HTTP/1.1\r\nExpect: 100-Continue\r\nContent-Length: 4\r\n\r\n");
    assert(request.state() == HttpRequest::State::ReadingBody);
    assert(request.expectsContinue());

    HttpRequest plain;
    plain.feed("GET / HTTP/1.1\r\n\r\n");
    assert(!plain.expectsContinue());
    printf("PASS: test_expect_continue\n");
}

void test_rejections() {
    HttpRequest::State state;
    HttpRequest tooLarge(100);
    state = tooLarge.feed("POST /export HTTP/1.1\r\nContent-Length: 101\r\n\r\n");
    assert(state == HttpRequest::State::Error);
    assert(tooLarge.errorStatus() == 413);

    HttpRequest chunked;
    chunked.feed("POST /export HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n");
    assert(chunked.errorStatus() == 411);

    HttpRequest badLength;
    badLength.feed("POST /export HTTP/1.1\r\nContent-Length: ten\r\n\r\n");
    assert(badLength.errorStatus() == 400);

    HttpRequest badLine;
    badLine.feed("GARBAGE\r\n\r\n");
    assert(badLine.state() == HttpRequest::State::Error);
    assert(badLine.errorStatus() == 400);

    HttpRequest hugeHeaders;
    QByteArray filler = "GET / HTTP/1.1\r\nX-Filler: " + QByteArray(HttpRequest::MaxHeaderBytes, 'a');
    state = hugeHeaders.feed(filler);
    assert(state == HttpRequest::State::Error);
    assert(hugeHeaders.errorStatus() == 431);
    // Nothing more is parsed once failed
    state = hugeHeaders.feed("\r\n\r\n");
    assert(state == HttpRequest::State::Error);
    printf("PASS: test_rejections\n");
}

void test_boundary_from_content_type() {
    assert(HttpRequest::boundaryFromContentType("multipart/form-data; boundary=abc123") == "abc123");
    assert(HttpRequest::boundaryFromContentType("multipart/form-data; boundary=\"quoted;value\"") == "quoted;value");
    assert(HttpRequest::boundaryFromContentType("MULTIPART/FORM-DATA;boundary=x") == "x");
    assert(HttpRequest::boundaryFromContentType("application/json").isEmpty());
    assert(HttpRequest::boundaryFromContentType("multipart/form-data").isEmpty());
    printf("PASS: test_boundary_from_content_type\n");
}

static QByteArray sampleMultipart() {
    return "preamble\r\n"
           "--XyZ\r\n"
           "Content-Disposition: form-data; name=\"timeline\"\r\n"
           "\r\n"
           "{\"tracks\":[]}\r\n"
           "--XyZ\r\n"
           "Content-Disposition: form-data; name=\"videos\"; filename=\"clip;1.mp4\"\r\n"
           "Content-Type: video/mp4\r\n"
           "\r\n"
           "AAAA\r\nBBBB\r\n"
           "--XyZ\r\n"
           "Content-Disposition: form-data; name=\"videos\"; filename=\"photo\"\r\n"
           "Content-Type: image/png\r\n"
           "\r\n"
           "PNG\r\n"
           "--XyZ\r\n"
           "Content-Disposition: form-data; name=\"empty\"; filename=\"\"\r\n"
           "\r\n"
           "\r\n"
           "--XyZ--\r\n";
}

void test_multipart_parse() {
    MultipartForm form;
    QString error;
    bool ok = HttpRequest::parseMultipartBody(sampleMultipart(), "XyZ", form, &error);
    assert(ok);
    assert(form.parts.size() == 4);

    assert(form.value("timeline") == "{\"tracks\":[]}");
    assert(form.value("missing").isNull());
    assert(form.file("timeline") == nullptr);

    std::vector<const MultipartPart*> videos = form.files("videos");
    assert(videos.size() == 2);
    assert(videos[0]->fileName == "clip;1.mp4");
    assert(videos[0]->contentType == "video/mp4");
    // Binary payloads keep their embedded CRLFs
    assert(videos[0]->data == "AAAA\r\nBBBB");
    assert(videos[1]->fileName == "photo");
    assert(videos[1]->data == "PNG");

    const MultipartPart* empty = form.file("empty");
    assert(empty != nullptr);
    assert(empty->isFile());
    assert(empty->fileName.isEmpty());
    assert(empty->data.isEmpty());
    printf("PASS: test_multipart_parse\n");
}

void test_multipart_errors() {
    MultipartForm form;
    QString error;
    bool ok = HttpRequest::parseMultipartBody("no delimiters here", "XyZ", form, &error);
    assert(!ok);
    assert(error.startsWith("Malformed multipart body"));

    QByteArray truncated = "--XyZ\r\nContent-Disposition: form-data; name=\"a\"\r\n\r\nvalue";
    MultipartForm partial;
    ok = HttpRequest::parseMultipartBody(truncated, "XyZ", partial, &error);
    assert(!ok);
    assert(error.contains("closing boundary"));

    HttpRequest request;
    request.feed("POST /export HTTP/1.1\r\nContent-Type: text/plain\r\nContent-Length: 0\r\n\r\n");
    MultipartForm fromRequest;
    ok = request.parseMultipart(fromRequest, &error);
    assert(!ok);
    assert(error == "Expected multipart/form-data");
    printf("PASS: test_multipart_errors\n");
}

void test_match_route() {
    RouteParams params;
    assert(HttpServer::matchRoute("/download/:jobId", "/download/abc-123", params));
    assert(params.value("jobId") == "abc-123");

    assert(HttpServer::matchRoute("/", "/", params));
    assert(params.isEmpty());
    assert(HttpServer::matchRoute("/health", "/health/", params));
    assert(!HttpServer::matchRoute("/download/:jobId", "/download", params));
    assert(!HttpServer::matchRoute("/download/:jobId", "/download-export/x", params));
    assert(!HttpServer::matchRoute("/export", "/export/extra", params));
    printf("PASS: test_match_route\n");
}

void test_job_id_from_download_url() {
    assert(RenderService::jobIdFromDownloadUrl("http://localhost:3001/download/abc") == "abc");
    assert(RenderService::jobIdFromDownloadUrl("/download/abc?t=1") == "abc");
    assert(RenderService::jobIdFromDownloadUrl("/download-export/abc").isEmpty());
    assert(RenderService::jobIdFromDownloadUrl("blob:abc").isEmpty());
    printf("PASS: test_job_id_from_download_url\n");
}

void test_download_names() {
    assert(HttpConnection::headerSafeFileName("clip \"final\".mp4") == "clip _final_.mp4");
    assert(HttpConnection::headerSafeFileName("a\r\nSet-Cookie: x.mp4") == "aSet-Cookie: x.mp4");
    assert(HttpConnection::headerSafeFileName(QString("tab\there")) == "tabhere");

    assert(RenderService::exportFileName("My Reel", "mp4") == "My Reel.mp4");
    assert(RenderService::exportFileName("  ", "mov") == "export.mov");
    assert(RenderService::exportFileName("\r\n", "mkv") == "export.mkv");
    assert(RenderService::exportFileName("x\r\nLocation: /", "mp4") == "xLocation: /.mp4");
    printf("PASS: test_download_names\n");
}

// Sends one raw request and collects the whole response until the server closes
static QByteArray roundTrip(quint16 port, const QByteArray& raw) {
    QTcpSocket socket;
    QByteArray response;
    QEventLoop loop;
    QObject::connect(&socket, &QTcpSocket::connected, [&socket, &raw]() { socket.write(raw); });
    QObject::connect(&socket, &QTcpSocket::readyRead, [&socket, &response]() { response += socket.readAll(); });
    QObject::connect(&socket, &QTcpSocket::disconnected, &loop, &QEventLoop::quit);
    QTimer::singleShot(5000, &loop, &QEventLoop::quit);
    socket.connectToHost(QHostAddress::LocalHost, port);
    loop.exec();
    response += socket.readAll();
    return response;
}

static QJsonObject jsonBody(const QByteArray& response) {
    const int split = response.indexOf("\r\n\r\n");
    return QJsonDocument::fromJson(response.mid(split + 4)).object();
}

void test_server_roundtrip() {
    QTemporaryDir dir;
    assert(dir.isValid());
    ServerConfig config;
    config.dataDir = dir.path();
    config.progressIntervalMs = 20;
    QDir().mkpath(config.exportsDir());
    QFile stale(QDir(config.exportsDir()).filePath("old.mp4"));
    bool opened = stale.open(QIODevice::WriteOnly);
    assert(opened);
    stale.close();

    JobRegistry registry;
    RenderService service(config, registry);
    HttpServer server(1024 * 1024);
    service.registerRoutes(server);
    bool listening = server.listen(QHostAddress::LocalHost, 0);
    assert(listening);
    const quint16 port = server.serverPort();

    QByteArray health = roundTrip(port, "GET /health HTTP/1.1\r\nHost: x\r\n\r\n");
    assert(health.startsWith("HTTP/1.1 200"));
    assert(health.contains("Access-Control-Allow-Origin: *"));
    assert(health.contains("Cross-Origin-Embedder-Policy: require-corp"));
    assert(jsonBody(health)["status"].toString() == "ok");

    QByteArray missing = roundTrip(port, "GET /nowhere HTTP/1.1\r\n\r\n");
    assert(missing.startsWith("HTTP/1.1 404"));
    assert(missing.contains("Cannot GET /nowhere"));

    QByteArray preflight = roundTrip(port, "OPTIONS /export HTTP/1.1\r\n\r\n");
    assert(preflight.startsWith("HTTP/1.1 204"));
    assert(preflight.contains("Access-Control-Allow-Methods"));

    QByteArray status = roundTrip(port, "GET /cache-status HTTP/1.1\r\n\r\n");
    assert(jsonBody(status)["hasCache"].toBool());
    assert(jsonBody(status)["fileCount"].toInt() == 1);

    // A finished export whose stored name carries a header break
    const QString artifact = QDir(config.exportsDir()).filePath("done.mp4");
    QFile artifactFile(artifact);
    opened = artifactFile.open(QIODevice::WriteOnly);
    assert(opened);
    artifactFile.write("hello");
    artifactFile.close();
    const QString doneId = registry.create(JobKind::Export, QString(), QString());
    bool named = registry.setOutput(doneId, artifact, "reel\r\nX-Injected: 1.mp4");
    assert(named);
    bool marked = registry.markDone(doneId);
    assert(marked);

    QByteArray head = roundTrip(port, "HEAD /download-export/" + doneId.toUtf8() + " HTTP/1.1\r\n\r\n");
    assert(head.startsWith("HTTP/1.1 200"));
    assert(head.contains("Content-Length: 5"));
    assert(head.contains("attachment; filename=\"reelX-Injected: 1.mp4\""));
    assert(!head.contains("\r\nX-Injected"));
    assert(head.endsWith("\r\n\r\n"));

    QByteArray get = roundTrip(port, "GET /download-export/" + doneId.toUtf8() + " HTTP/1.1\r\n\r\n");
    assert(get.startsWith("HTTP/1.1 200"));
    assert(get.endsWith("\r\n\r\nhello"));

    QByteArray download = roundTrip(port, "GET /download-export/unknown HTTP/1.1\r\n\r\n");
    assert(download.startsWith("HTTP/1.1 404"));
    assert(download.contains("File not ready or not found"));

    QByteArray progress = roundTrip(port, "GET /export-progress/unknown HTTP/1.1\r\n\r\n");
    assert(progress.startsWith("HTTP/1.1 200"));
    assert(progress.contains("text/event-stream"));
    assert(progress.contains("data: "));
    assert(progress.contains("Export not found"));

    QByteArray body = "--b\r\nContent-Disposition: form-data; name=\"timeline\"\r\n\r\nnot json\r\n--b--\r\n";
    QByteArray exportRequest = "POST /export HTTP/1.1\r\nContent-Type: multipart/form-data; boundary=b\r\n"
                               "Content-Length: " + QByteArray::number(body.size()) + "\r\n\r\n" + body;
    QByteArray rejected = roundTrip(port, exportRequest);
    assert(rejected.startsWith("HTTP/1.1 400"));
    assert(jsonBody(rejected).contains("error"));
    // Only the finished export above; the rejected request created no job
    assert(registry.jobs().size() == 1);

    QByteArray oversized = roundTrip(port, "POST /export HTTP/1.1\r\nContent-Length: 99999999\r\n\r\n");
    assert(oversized.startsWith("HTTP/1.1 413"));

    QByteArray cleared = roundTrip(port, "POST /clear-cache HTTP/1.1\r\nContent-Length: 0\r\n\r\n");
    assert(jsonBody(cleared)["success"].toBool());
    assert(jsonBody(cleared)["filesDeleted"].toInt() == 2);
    assert(!QFile::exists(stale.fileName()));
    assert(service.runningTaskCount() == 0);

    server.close();
    printf("PASS: test_server_roundtrip\n");
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    test_incremental_get();
    test_body_by_content_length();
    test_expect_continue();
    test_rejections();
    test_boundary_from_content_type();
    test_multipart_parse();
    test_multipart_errors();
    test_match_route();
    test_job_id_from_download_url();
    test_download_names();
    test_server_roundtrip();
    printf("All HTTP request tests passed.\n");
    return 0;
}
