#pragma once

#include <QString>
#include "MediaSource.h"

struct MediaInfo {
    QString filePath;
    double duration = 0.0;
    bool hasVideo = false;
    bool hasAudio = false;
    bool isStillImage = false;  // single-picture demuxer (image2, *_pipe)
};

// Reads stream layout and duration of a media file with libavformat.
// Blocking; callers off the event loop run it through QtConcurrent.
class MediaProbe {
public:
    MediaProbe() = default;

    bool probe(const QString& filePath);
    const MediaInfo& info() const { return m_info; }
    QString errorString() const { return m_error; }

    // Resolve the probed file into a timeline MediaSource
    MediaSource toMediaSource(const QString& id, const QString& contentType = QString()) const;

    static bool isImagePath(const QString& filePath);
    static bool isImageContentType(const QString& contentType);
    static QString extensionForContentType(const QString& contentType);

private:
    MediaInfo m_info;
    QString m_error;
};
