#pragma once

#include <QString>
#include <QStringList>
#include <QJsonObject>
#include <QHostAddress>
#include "AppConstants.h"

class QCommandLineParser;

struct ServerConfig {
    QHostAddress host = QHostAddress::Any;
    int port = AppConstants::DefaultPort;
    QString dataDir = "data";
    QString encoderPath = "ffmpeg";
    int progressIntervalMs = AppConstants::ProgressIntervalMs;
    qint64 maxBodyBytes = AppConstants::DefaultMaxBodyBytes;
    int encoderThreads = 0;     // 0 = cores - 1

    QString uploadsDir() const;
    QString outputsDir() const;
    QString exportsDir() const;
    int effectiveEncoderThreads() const;
};

class ServerConfigLoader {
public:
    // Adds --config, --port, --data-dir and --ffmpeg
    static void addOptions(QCommandLineParser& parser);

    bool load(const QCommandLineParser& parser, ServerConfig& config);
    bool loadFile(const QString& filePath, ServerConfig& config);
    bool ensureDirectories(const ServerConfig& config);

    static QJsonObject toJson(const ServerConfig& config);
    static ServerConfig fromJson(const QJsonObject& obj);

    QString errorString() const { return m_error; }

private:
    QString m_error;
};
