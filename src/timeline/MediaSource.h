#pragma once

#include <QString>
#include <QHash>

enum class MediaKind {
    Video,
    Audio,
    Image
};

struct MediaSource {
    QString id;
    QString path;
    MediaKind kind = MediaKind::Video;
    double duration = 0.0;
    bool hasVideo = false;
    bool hasAudio = false;
};

// Resolved sources keyed by media file id
using MediaLibrary = QHash<QString, MediaSource>;

QString mediaKindName(MediaKind kind);
