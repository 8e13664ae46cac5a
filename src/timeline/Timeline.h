#pragma once

#include <QString>
#include <vector>
#include "Track.h"

enum class TemplateLayout {
    Solo,
    DuetVertical,
    DuetHorizontal,
    TrioStack,
    Unknown
};

QString layoutName(TemplateLayout layout);
TemplateLayout layoutFromName(const QString& name);

class Timeline {
public:
    Timeline() = default;

    Track& addVideoTrack(const Track& track);
    Track& addAudioTrack(const Track& track);

    const std::vector<Track>& videoTracks() const { return m_videoTracks; }
    const std::vector<Track>& audioTracks() const { return m_audioTracks; }
    std::vector<Track>& videoTracks() { return m_videoTracks; }
    std::vector<Track>& audioTracks() { return m_audioTracks; }

    TemplateLayout layout() const { return m_layout; }
    void setLayout(TemplateLayout layout) { m_layout = layout; }

    // Duration reported by the client, or the computed one when absent
    double duration() const;
    void setDeclaredDuration(double seconds) { m_declaredDuration = seconds; }
    double computedDuration() const;   // max end time across all tracks

private:
    std::vector<Track> m_videoTracks;
    std::vector<Track> m_audioTracks;
    TemplateLayout m_layout = TemplateLayout::Solo;
    double m_declaredDuration = -1.0;
};
