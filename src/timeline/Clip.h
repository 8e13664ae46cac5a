#pragma once

#include <QString>
#include <optional>
#include <vector>
#include "ClipEffects.h"

struct Clip {
    QString id;
    QString mediaFileId;
    double sourceStart = 0.0;     // trim window in source time (seconds)
    double sourceEnd = 0.0;
    double timelineStart = 0.0;   // position on the track
    std::optional<Transition> transitionStart;
    std::optional<Transition> transitionEnd;
    std::optional<ColorGrading> colorGrading;
    std::vector<ReframeKeyframe> reframeKeyframes;
    double volume = 1.0;
    bool isMuted = false;
    QString processedVideoUrl;    // ".../download/<jobId>" of a slow-motion render

    double duration() const { return sourceEnd - sourceStart; }
    double timelineEnd() const { return timelineStart + duration(); }

    bool hasStartTransition() const { return transitionStart && transitionStart->isActive(); }
    bool hasEndTransition() const { return transitionEnd && transitionEnd->isActive(); }
};
