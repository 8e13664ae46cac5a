#pragma once

#include <QString>
#include <vector>
#include "Clip.h"
#include "EncoderProfile.h"
#include "FilterGraph.h"
#include "MediaSource.h"

// Labelled outputs of one clip's sub-graph
struct ClipStreams {
    QString video;
    QString audio;
    double duration = 0.0;   // sourceEnd - sourceStart
};

enum class ClipRenderMode {
    Timeline,           // clip feeds the transition chain of a full export
    IntermediateChunk   // clip is rendered on its own, padded, CFR-retimed
};

class ClipGraphBuilder {
public:
    explicit ClipGraphBuilder(FilterGraph& graph, ClipRenderMode mode = ClipRenderMode::Timeline);

    // Emits the video and audio chains for input #inputIndex
    ClipStreams build(const Clip& clip, const MediaSource& source, int inputIndex,
                      double trackVolume, bool trackMuted = false);

    // Source time consumed by the trim, including chunk padding
    double trimDuration(const Clip& clip) const;

    EncoderInput inputFor(const Clip& clip, const MediaSource& source) const;

    static double effectiveVolume(const Clip& clip, double trackVolume, bool trackMuted);
    static std::vector<Filter> reframeFilters(const Clip& clip);
    static std::vector<Filter> gradingFilters(const ColorGrading& grading);

private:
    QString buildVideo(const Clip& clip, int inputIndex);
    QString buildAudio(const Clip& clip, const MediaSource& source, int inputIndex, double volume);

    FilterGraph& m_graph;
    ClipRenderMode m_mode;
};
