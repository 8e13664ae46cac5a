#include "Timeline.h"
#include "MediaSource.h"
#include <algorithm>

QString layoutName(TemplateLayout layout) {
    switch (layout) {
    case TemplateLayout::Solo: return "solo";
    case TemplateLayout::DuetVertical: return "duet-vertical";
    case TemplateLayout::DuetHorizontal: return "duet-horizontal";
    case TemplateLayout::TrioStack: return "trio-stack";
    case TemplateLayout::Unknown: break;
    }
    return "unknown";
}

TemplateLayout layoutFromName(const QString& name) {
    if (name == "solo") return TemplateLayout::Solo;
    if (name == "duet-vertical") return TemplateLayout::DuetVertical;
    if (name == "duet-horizontal") return TemplateLayout::DuetHorizontal;
    if (name == "trio-stack") return TemplateLayout::TrioStack;
    return TemplateLayout::Unknown;
}

QString mediaKindName(MediaKind kind) {
    switch (kind) {
    case MediaKind::Video: return "video";
    case MediaKind::Audio: return "audio";
    case MediaKind::Image: return "image";
    }
    return "unknown";
}

Track& Timeline::addVideoTrack(const Track& track) {
    m_videoTracks.push_back(track);
    return m_videoTracks.back();
}

Track& Timeline::addAudioTrack(const Track& track) {
    m_audioTracks.push_back(track);
    return m_audioTracks.back();
}

double Timeline::duration() const {
    return m_declaredDuration >= 0.0 ? m_declaredDuration : computedDuration();
}

double Timeline::computedDuration() const {
    double maxDur = 0.0;
    for (const auto& t : m_videoTracks) {
        maxDur = std::max(maxDur, t.duration());
    }
    for (const auto& t : m_audioTracks) {
        maxDur = std::max(maxDur, t.duration());
    }
    return maxDur;
}
