#pragma once

#include <QString>
#include <vector>
#include "EncoderProfile.h"
#include "FilterGraph.h"
#include "MediaSource.h"
#include "Timeline.h"
#include "TransitionChainBuilder.h"

// Result of compiling a timeline: encoder inputs plus a filter graph whose
// two output pads are mapped into the final file.
struct CompiledGraph {
    std::vector<EncoderInput> inputs;
    FilterGraph graph;
    QString videoOutput;
    QString audioOutput;
    double expectedDuration = 0.0;
    std::vector<BoundaryDecision> boundaries;
    bool shortestOutput = false;

    EncoderInvocation toInvocation(const QString& outputPath, OutputSettings settings) const;
};

// Turns a Timeline and its resolved media into a CompiledGraph. Pure: the
// same timeline always yields the same graph and nothing touches the disk.
class ExportCompiler {
public:
    ExportCompiler() = default;

    bool compile(const Timeline& timeline, const MediaLibrary& media, CompiledGraph& out);

    // Single clip rendered as a padded, CFR intermediate chunk
    bool compileChunk(const Clip& clip, const MediaSource& source, double trackVolume,
                      bool trackMuted, CompiledGraph& out);

    QString errorString() const { return m_error; }

private:
    bool resolve(const Clip& clip, const MediaLibrary& media, const MediaSource*& source);
    bool mixMusic(const Timeline& timeline, const MediaLibrary& media, CompiledGraph& out,
                  const QString& masterAudio);

    QString m_error;
};
