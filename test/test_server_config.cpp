#include <cassert>
#include <cstdio>
#include <QCommandLineParser>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QTemporaryDir>
#include "app/AppConstants.h"
#include "app/ServerConfig.h"

static QString writeConfig(const QTemporaryDir& dir, const QByteArray& json) {
    const QString path = dir.filePath("reelforge.json");
    QFile file(path);
    bool opened = file.open(QIODevice::WriteOnly);
    assert(opened);
    file.write(json);
    return path;
}

void test_defaults() {
    ServerConfig config;
    assert(config.port == AppConstants::DefaultPort);
    assert(config.encoderPath == "ffmpeg");
    assert(config.progressIntervalMs == AppConstants::ProgressIntervalMs);
    assert(config.uploadsDir().endsWith("data/uploads"));
    assert(config.outputsDir().endsWith("data/outputs"));
    assert(config.exportsDir().endsWith("data/exports"));
    assert(config.effectiveEncoderThreads() >= 1);

    config.encoderThreads = 3;
    assert(config.effectiveEncoderThreads() == 3);
    printf("PASS: test_defaults\n");
}

void test_json_roundtrip() {
    ServerConfig config;
    config.host = QHostAddress::LocalHost;
    config.port = 8080;
    config.dataDir = "/srv/reelforge";
    config.encoderPath = "/opt/ffmpeg/bin/ffmpeg";
    config.progressIntervalMs = 250;
    config.maxBodyBytes = 1024;
    config.encoderThreads = 2;

    ServerConfig restored = ServerConfigLoader::fromJson(ServerConfigLoader::toJson(config));
    assert(restored.host == QHostAddress(QHostAddress::LocalHost));
    assert(restored.port == 8080);
    assert(restored.dataDir == "/srv/reelforge");
    assert(restored.encoderPath == "/opt/ffmpeg/bin/ffmpeg");
    assert(restored.progressIntervalMs == 250);
    assert(restored.maxBodyBytes == 1024);
    assert(restored.encoderThreads == 2);
    printf("PASS: test_json_roundtrip\n");
}

void test_from_json_clamps() {
    QJsonObject obj;
    obj["host"] = "not an address";
    obj["progressIntervalMs"] = 1;
    obj["encoderThreads"] = -4;
    ServerConfig config = ServerConfigLoader::fromJson(obj);
    assert(config.host == QHostAddress(QHostAddress::Any));
    assert(config.progressIntervalMs == 50);
    assert(config.encoderThreads == 0);
    assert(config.port == AppConstants::DefaultPort);
    printf("PASS: test_from_json_clamps\n");
}

void test_load_file() {
    QTemporaryDir dir;
    assert(dir.isValid());
    const QString path = writeConfig(dir, "{\"port\": 4100, \"dataDir\": \"media\"}");

    ServerConfigLoader loader;
    ServerConfig config;
    bool loaded = loader.loadFile(path, config);
    assert(loaded);
    assert(config.port == 4100);
    // Relative to the file, not the working directory
    assert(config.dataDir == QDir(dir.path()).absoluteFilePath("media"));

    ServerConfig untouched;
    loaded = loader.loadFile(dir.filePath("missing.json"), untouched);
    assert(!loaded);
    assert(loader.errorString().startsWith("Cannot read"));

    const QString broken = writeConfig(dir, "{ port: ");
    loaded = loader.loadFile(broken, untouched);
    assert(!loaded);
    assert(loader.errorString().startsWith("Invalid config format"));
    printf("PASS: test_load_file\n");
}

void test_command_line_overrides() {
    QTemporaryDir dir;
    assert(dir.isValid());
    const QString path = writeConfig(dir, "{\"port\": 4100, \"ffmpeg\": \"/usr/bin/ffmpeg\"}");

    QCommandLineParser parser;
    ServerConfigLoader::addOptions(parser);
    bool parsed = parser.parse({"reelforge-server", "--config", path, "--port", "5000",
                                "--data-dir", "/tmp/rf-data", "--ffmpeg", "/opt/ffmpeg"});
    assert(parsed);

    ServerConfigLoader loader;
    ServerConfig config;
    bool loaded = loader.load(parser, config);
    assert(loaded);
    assert(config.port == 5000);
    assert(config.dataDir == "/tmp/rf-data");
    assert(config.encoderPath == "/opt/ffmpeg");
    printf("PASS: test_command_line_overrides\n");
}

void test_invalid_port() {
    QCommandLineParser parser;
    ServerConfigLoader::addOptions(parser);
    bool parsed = parser.parse({"reelforge-server", "--port", "70000"});
    assert(parsed);

    ServerConfigLoader loader;
    ServerConfig config;
    bool loaded = loader.load(parser, config);
    assert(!loaded);
    assert(loader.errorString() == "Invalid port: 70000");
    printf("PASS: test_invalid_port\n");
}

void test_ensure_directories() {
    QTemporaryDir dir;
    assert(dir.isValid());
    ServerConfig config;
    config.dataDir = dir.filePath("nested/data");

    ServerConfigLoader loader;
    bool created = loader.ensureDirectories(config);
    assert(created);
    assert(QFileInfo(config.uploadsDir()).isDir());
    assert(QFileInfo(config.outputsDir()).isDir());
    assert(QFileInfo(config.exportsDir()).isDir());

    // A plain file where the data directory should be
    QFile blocker(dir.filePath("blocked"));
    bool opened = blocker.open(QIODevice::WriteOnly);
    assert(opened);
    blocker.close();
    config.dataDir = blocker.fileName();
    created = loader.ensureDirectories(config);
    assert(!created);
    assert(loader.errorString().startsWith("Cannot create directory"));
    printf("PASS: test_ensure_directories\n");
}

int main() {
    test_defaults();
    test_json_roundtrip();
    test_from_json_clamps();
    test_load_file();
    test_command_line_overrides();
    test_invalid_port();
    test_ensure_directories();
    printf("All server config tests passed.\n");
    return 0;
}
