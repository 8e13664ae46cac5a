#include "TimelineReader.h"
#include "Logging.h"

#include <QJsonArray>
#include <QJsonDocument>

bool TimelineReader::read(const QByteArray& json, Timeline& timeline) {
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        m_error = QString("Invalid timeline JSON: %1").arg(parseError.errorString());
        return false;
    }
    if (!doc.isObject()) {
        m_error = "Invalid timeline format";
        return false;
    }
    return read(doc.object(), timeline);
}

bool TimelineReader::read(const QJsonObject& root, Timeline& timeline) {
    if (!root["videoTracks"].isArray()) {
        m_error = "Timeline has no videoTracks array";
        return false;
    }

    Timeline result;

    for (const auto& val : root["videoTracks"].toArray()) {
        if (!val.isObject()) {
            m_error = "Video track is not an object";
            return false;
        }
        result.addVideoTrack(trackFromJson(val.toObject(), TrackType::Video));
    }

    for (const auto& val : root["audioTracks"].toArray()) {
        if (!val.isObject()) {
            m_error = "Audio track is not an object";
            return false;
        }
        result.addAudioTrack(trackFromJson(val.toObject(), TrackType::Audio));
    }

    if (root["duration"].isDouble()) {
        result.setDeclaredDuration(root["duration"].toDouble());
    }

    // The layout travels inside the template; older clients send it top-level
    QString layout = root["template"].toObject()["layout"].toString();
    if (layout.isEmpty()) layout = root["layout"].toString("solo");
    result.setLayout(layoutFromName(layout));

    timeline = result;
    return true;
}

Track TimelineReader::trackFromJson(const QJsonObject& obj, TrackType type) {
    Track track(type, obj["id"].toString());
    track.setVolume(obj["volume"].toDouble(1.0));
    track.setMuted(obj["isMuted"].toBool(false));

    for (const auto& val : obj["clips"].toArray()) {
        track.addClip(clipFromJson(val.toObject()));
    }
    track.sortClips();
    return track;
}

Clip TimelineReader::clipFromJson(const QJsonObject& obj) {
    Clip clip;
    clip.id = obj["id"].toString();
    clip.mediaFileId = obj["mediaFileId"].toString();
    clip.sourceStart = obj["sourceStart"].toDouble();
    clip.sourceEnd = obj["sourceEnd"].toDouble();
    clip.timelineStart = obj["timelineStart"].toDouble();
    clip.volume = obj["volume"].toDouble(1.0);
    clip.isMuted = obj["isMuted"].toBool(false);
    clip.processedVideoUrl = obj["processedVideoUrl"].toString();

    if (obj["transitionStart"].isObject()) {
        clip.transitionStart = transitionFromJson(obj["transitionStart"].toObject());
    }
    if (obj["transitionEnd"].isObject()) {
        clip.transitionEnd = transitionFromJson(obj["transitionEnd"].toObject());
    }
    if (obj["colorGrading"].isObject()) {
        clip.colorGrading = gradingFromJson(obj["colorGrading"].toObject());
    }
    for (const auto& val : obj["reframeKeyframes"].toArray()) {
        clip.reframeKeyframes.push_back(keyframeFromJson(val.toObject()));
    }
    return clip;
}

ColorGrading TimelineReader::gradingFromJson(const QJsonObject& obj) {
    ColorGrading grading;
    grading.brightness = obj["brightness"].toDouble(1.0);
    grading.contrast = obj["contrast"].toDouble(1.0);
    grading.saturation = obj["saturation"].toDouble(1.0);
    grading.exposure = obj["exposure"].toDouble(0.0);
    grading.sharpness = obj["sharpness"].toDouble(0.0);
    return grading;
}

ReframeKeyframe TimelineReader::keyframeFromJson(const QJsonObject& obj) {
    ReframeKeyframe kf;
    kf.time = obj["time"].toDouble();
    kf.x = obj["x"].toDouble(0.5);
    kf.y = obj["y"].toDouble(0.5);
    kf.scale = obj["scale"].toDouble(1.0);
    return kf;
}

Transition TimelineReader::transitionFromJson(const QJsonObject& obj) {
    Transition t;
    QString name = obj["type"].toString();
    if (!transitionTypeFromName(name, t.type)) {
        qCWarning(REELFORGE_EXPORT_LOG) << "Unknown transition type" << name << "- using cross-dissolve";
        t.type = TransitionType::CrossDissolve;
    }
    t.duration = obj["duration"].toDouble(0.0);
    return t;
}
