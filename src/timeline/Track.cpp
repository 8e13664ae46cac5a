#include "Track.h"
#include <algorithm>

namespace {
// Clips touching within this tolerance are not an overlap
constexpr double kOverlapTolerance = 1e-6;
}

Track::Track(TrackType type, const QString& id)
    : m_type(type), m_id(id) {}

void Track::addClip(const Clip& clip) {
    m_clips.push_back(clip);
}

void Track::sortClips() {
    std::stable_sort(m_clips.begin(), m_clips.end(), [](const Clip& a, const Clip& b) {
        return a.timelineStart < b.timelineStart;
    });
}

double Track::duration() const {
    double maxEnd = 0.0;
    for (const auto& c : m_clips) {
        double end = c.timelineEnd();
        if (end > maxEnd) maxEnd = end;
    }
    return maxEnd;
}

bool Track::validate(QString* error) const {
    auto fail = [error](const QString& message) {
        if (error) *error = message;
        return false;
    };

    for (size_t i = 0; i < m_clips.size(); ++i) {
        const Clip& c = m_clips[i];
        if (!(c.sourceStart < c.sourceEnd)) {
            return fail(QString("Clip %1 has an empty trim window (%2 - %3)")
                            .arg(c.id).arg(c.sourceStart).arg(c.sourceEnd));
        }
        if (c.sourceStart < 0.0) {
            return fail(QString("Clip %1 starts before its source").arg(c.id));
        }
        if (c.timelineStart < 0.0) {
            return fail(QString("Clip %1 has a negative timeline position").arg(c.id));
        }
        if (i > 0) {
            const Clip& prev = m_clips[i - 1];
            if (c.timelineStart < prev.timelineStart) {
                return fail(QString("Clips on track %1 are not ordered").arg(m_id));
            }
            if (prev.timelineEnd() - c.timelineStart > kOverlapTolerance) {
                return fail(QString("Clips %1 and %2 overlap on track %3")
                                .arg(prev.id, c.id, m_id));
            }
        }
    }
    return true;
}
