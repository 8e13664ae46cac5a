#pragma once

#include <QString>
#include <QStringList>
#include "Clip.h"
#include "FilterGraph.h"

// Mixes music clips, placed at their timeline positions, under the master
// audio of the video track.
class AudioMixStage {
public:
    AudioMixStage(FilterGraph& graph, const QString& masterAudio);

    // Delays and scales the clip read from input #inputIndex; returns its label
    QString addClip(const Clip& clip, double trackVolume, int inputIndex);

    // Emits amix (or a passthrough) and returns the mixed label
    QString finish();

    // "ms|ms" for adelay, ms rounded to the nearest integer
    static QString delaySpec(double timelineStart);

private:
    FilterGraph& m_graph;
    QStringList m_inputs;
};
