#pragma once

#include <QString>
#include <vector>
#include "Clip.h"
#include "ClipGraphBuilder.h"
#include "FilterGraph.h"

enum class BoundaryKind {
    FadeIn,           // start of the first clip
    Crossfade,        // xfade + acrossfade between two clips
    Concat,           // hard cut
    ConcatFallback,   // transition longer than the chain so far; hard cut instead
    FadeOut,          // end of the last clip
    FadeOutSkipped    // fade-out would start at or before 0
};

// What was decided at one boundary; kept for logging and tests
struct BoundaryDecision {
    int clipIndex = 0;          // clip the boundary leads into (or ends)
    BoundaryKind kind = BoundaryKind::Concat;
    QString effect;             // xfade transition name or fade color
    double duration = 0.0;
    double offset = 0.0;        // xfade offset / fade start
    double chainEndAfter = 0.0;
};

struct ChainResult {
    QString video;              // v_final
    QString audio;              // a_final
    double chainEnd = 0.0;      // length of the folded chain in seconds
    std::vector<BoundaryDecision> boundaries;
};

// Folds the per-clip streams of one track into a single video and audio
// stream, applying start fades, pairwise crossfades and the end fade.
class TransitionChainBuilder {
public:
    explicit TransitionChainBuilder(FilterGraph& graph) : m_graph(graph) {}

    // clips and streams are parallel and non-empty
    ChainResult fold(const std::vector<Clip>& clips, const std::vector<ClipStreams>& streams);

    static QString xfadeEffect(TransitionType type);
    static QString fadeColor(TransitionType type);

    // Transition governing the cut between clips a and b, if any
    static std::optional<Transition> boundaryTransition(const Clip& a, const Clip& b);

private:
    FilterGraph& m_graph;
};

QString boundaryKindName(BoundaryKind kind);
