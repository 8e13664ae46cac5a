#pragma once

#include <QString>
#include <vector>
#include "Clip.h"

enum class TrackType {
    Video,
    Audio
};

class Track {
public:
    Track() = default;
    Track(TrackType type, const QString& id);

    TrackType type() const { return m_type; }
    QString id() const { return m_id; }

    void addClip(const Clip& clip);
    int clipCount() const { return static_cast<int>(m_clips.size()); }
    const Clip& clip(int index) const { return m_clips[index]; }
    const std::vector<Clip>& clips() const { return m_clips; }

    // Stable sort by timelineStart
    void sortClips();

    double duration() const;

    double volume() const { return m_volume; }
    void setVolume(double volume) { m_volume = volume; }
    bool isMuted() const { return m_muted; }
    void setMuted(bool muted) { m_muted = muted; }

    // Trim windows must be non-empty, positions non-negative, clips disjoint
    bool validate(QString* error = nullptr) const;

private:
    TrackType m_type = TrackType::Video;
    QString m_id;
    std::vector<Clip> m_clips;
    double m_volume = 1.0;
    bool m_muted = false;
};
