#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include "Timeline.h"

// Reads the editor's timeline JSON ({videoTracks, audioTracks, duration, template})
class TimelineReader {
public:
    TimelineReader() = default;

    bool read(const QByteArray& json, Timeline& timeline);
    bool read(const QJsonObject& root, Timeline& timeline);

    static Track trackFromJson(const QJsonObject& obj, TrackType type);
    static Clip clipFromJson(const QJsonObject& obj);
    static ColorGrading gradingFromJson(const QJsonObject& obj);
    static ReframeKeyframe keyframeFromJson(const QJsonObject& obj);

    // Unknown transition types are reported as cross-dissolves
    static Transition transitionFromJson(const QJsonObject& obj);

    QString errorString() const { return m_error; }

private:
    QString m_error;
};
