#include "ServerConfig.h"
#include "Logging.h"

#include <QCommandLineParser>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QStandardPaths>
#include <QThread>
#include <algorithm>

QString ServerConfig::uploadsDir() const {
    return QDir(dataDir).absoluteFilePath("uploads");
}

QString ServerConfig::outputsDir() const {
    return QDir(dataDir).absoluteFilePath("outputs");
}

QString ServerConfig::exportsDir() const {
    return QDir(dataDir).absoluteFilePath("exports");
}

int ServerConfig::effectiveEncoderThreads() const {
    if (encoderThreads > 0) return encoderThreads;
    return std::max(1, QThread::idealThreadCount() - 1);
}

void ServerConfigLoader::addOptions(QCommandLineParser& parser) {
    parser.addOption({{"c", "config"}, "Read settings from a JSON file.", "file"});
    parser.addOption({{"p", "port"}, "TCP port to listen on.", "port"});
    parser.addOption({"data-dir", "Directory for uploads, outputs and exports.", "dir"});
    parser.addOption({"ffmpeg", "Path of the ffmpeg executable.", "path"});
}

bool ServerConfigLoader::load(const QCommandLineParser& parser, ServerConfig& config) {
    if (parser.isSet("config") && !loadFile(parser.value("config"), config)) {
        return false;
    }

    if (parser.isSet("port")) {
        bool ok = false;
        int port = parser.value("port").toInt(&ok);
        if (!ok || port <= 0 || port > 65535) {
            m_error = QString("Invalid port: %1").arg(parser.value("port"));
            return false;
        }
        config.port = port;
    }
    if (parser.isSet("data-dir")) {
        config.dataDir = parser.value("data-dir");
    }
    if (parser.isSet("ffmpeg")) {
        config.encoderPath = parser.value("ffmpeg");
    }

    // Bare program names are looked up on PATH once, at startup
    if (!config.encoderPath.contains('/')) {
        QString found = QStandardPaths::findExecutable(config.encoderPath);
        if (found.isEmpty()) {
            qCWarning(REELFORGE_SERVER_LOG) << "Encoder" << config.encoderPath << "not found on PATH";
        } else {
            config.encoderPath = found;
        }
    }
    return true;
}

bool ServerConfigLoader::loadFile(const QString& filePath, ServerConfig& config) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        m_error = QString("Cannot read: %1").arg(filePath);
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        m_error = QString("Invalid config format: %1").arg(parseError.errorString());
        return false;
    }

    config = fromJson(doc.object());

    // Relative data directories are resolved against the config file
    if (QDir::isRelativePath(config.dataDir)) {
        config.dataDir = QFileInfo(filePath).absoluteDir().absoluteFilePath(config.dataDir);
    }
    return true;
}

bool ServerConfigLoader::ensureDirectories(const ServerConfig& config) {
    for (const QString& dir : {config.uploadsDir(), config.outputsDir(), config.exportsDir()}) {
        if (!QDir().mkpath(dir)) {
            m_error = QString("Cannot create directory: %1").arg(dir);
            return false;
        }
    }
    return true;
}

QJsonObject ServerConfigLoader::toJson(const ServerConfig& config) {
    QJsonObject obj;
    obj["host"] = config.host.toString();
    obj["port"] = config.port;
    obj["dataDir"] = config.dataDir;
    obj["ffmpeg"] = config.encoderPath;
    obj["progressIntervalMs"] = config.progressIntervalMs;
    obj["maxBodyBytes"] = static_cast<double>(config.maxBodyBytes);
    obj["encoderThreads"] = config.encoderThreads;
    return obj;
}

ServerConfig ServerConfigLoader::fromJson(const QJsonObject& obj) {
    ServerConfig config;
    if (obj.contains("host")) {
        QHostAddress host(obj["host"].toString());
        if (!host.isNull()) config.host = host;
    }
    config.port = obj["port"].toInt(config.port);
    config.dataDir = obj["dataDir"].toString(config.dataDir);
    config.encoderPath = obj["ffmpeg"].toString(config.encoderPath);
    config.progressIntervalMs = std::max(50, obj["progressIntervalMs"].toInt(config.progressIntervalMs));
    config.maxBodyBytes = static_cast<qint64>(
        obj["maxBodyBytes"].toDouble(static_cast<double>(config.maxBodyBytes)));
    config.encoderThreads = std::max(0, obj["encoderThreads"].toInt(config.encoderThreads));
    return config;
}
