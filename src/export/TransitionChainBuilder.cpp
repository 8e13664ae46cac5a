#include "TransitionChainBuilder.h"
#include "AppConstants.h"
#include "Logging.h"

QString boundaryKindName(BoundaryKind kind) {
    switch (kind) {
    case BoundaryKind::FadeIn: return "fade-in";
    case BoundaryKind::Crossfade: return "crossfade";
    case BoundaryKind::Concat: return "concat";
    case BoundaryKind::ConcatFallback: return "concat-fallback";
    case BoundaryKind::FadeOut: return "fade-out";
    case BoundaryKind::FadeOutSkipped: return "fade-out-skipped";
    }
    return "concat";
}

QString TransitionChainBuilder::xfadeEffect(TransitionType type) {
    switch (type) {
    case TransitionType::BlurDissolve: return "pixelize";
    case TransitionType::DipToBlack: return "fadeblack";
    case TransitionType::DipToWhite: return "fadewhite";
    default: return "fade";
    }
}

QString TransitionChainBuilder::fadeColor(TransitionType type) {
    return type == TransitionType::DipToWhite ? "white" : "black";
}

std::optional<Transition> TransitionChainBuilder::boundaryTransition(const Clip& a, const Clip& b) {
    if (a.hasEndTransition()) return a.transitionEnd;
    if (b.hasStartTransition()) return b.transitionStart;
    return std::nullopt;
}

ChainResult TransitionChainBuilder::fold(const std::vector<Clip>& clips,
                                         const std::vector<ClipStreams>& streams) {
    ChainResult result;
    if (clips.empty() || streams.size() != clips.size()) return result;

    QString lastV = streams[0].video;
    QString lastA = streams[0].audio;
    double chainEnd = streams[0].duration;

    const Clip& first = clips.front();
    if (first.hasStartTransition()) {
        const Transition& t = *first.transitionStart;
        const QString color = fadeColor(t.type);

        std::vector<Filter> v;
        v.push_back(Filter("fade").option("t", "in").option("st", 0.0)
                        .option("d", t.duration).option("color", color));
        lastV = m_graph.addChain({lastV}, std::move(v), "v0_faded");

        std::vector<Filter> a;
        a.push_back(Filter("afade").option("t", "in").option("st", 0.0).option("d", t.duration));
        lastA = m_graph.addChain({lastA}, std::move(a), "a0_faded");

        result.boundaries.push_back({0, BoundaryKind::FadeIn, color, t.duration, 0.0, chainEnd});
    }

    for (size_t i = 0; i + 1 < clips.size(); ++i) {
        const int next = static_cast<int>(i + 1);
        const double nextDuration = streams[next].duration;
        const QString vLabel = QString("vm%1").arg(next);
        const QString aLabel = QString("am%1").arg(next);

        BoundaryDecision decision;
        decision.clipIndex = next;

        std::optional<Transition> t = boundaryTransition(clips[i], clips[next]);
        const double offset = t ? chainEnd - t->duration : 0.0;

        if (t && offset >= 0.0) {
            const QString effect = xfadeEffect(t->type);

            std::vector<Filter> v;
            v.push_back(Filter("xfade").option("transition", effect)
                            .option("duration", t->duration).option("offset", offset));
            lastV = m_graph.addChain({lastV, streams[next].video}, std::move(v), vLabel);

            std::vector<Filter> a;
            a.push_back(Filter("acrossfade").option("d", t->duration)
                            .option("c1", "tri").option("c2", "tri"));
            lastA = m_graph.addChain({lastA, streams[next].audio}, std::move(a), aLabel);

            chainEnd = offset + nextDuration;
            decision.kind = BoundaryKind::Crossfade;
            decision.effect = effect;
            decision.duration = t->duration;
            decision.offset = offset;
        } else {
            if (t) {
                qCWarning(REELFORGE_EXPORT_LOG) << "Transition" << i << "->" << next
                                                << "of" << t->duration << "s exceeds chain length"
                                                << chainEnd << "s, using a hard cut";
                decision.kind = BoundaryKind::ConcatFallback;
                decision.duration = t->duration;
                decision.offset = offset;
            } else {
                decision.kind = BoundaryKind::Concat;
            }

            std::vector<Filter> v;
            v.push_back(Filter("concat").option("n", "2").option("v", "1").option("a", "0"));
            lastV = m_graph.addChain({lastV, streams[next].video}, std::move(v), vLabel);

            std::vector<Filter> a;
            a.push_back(Filter("concat").option("n", "2").option("v", "0").option("a", "1"));
            lastA = m_graph.addChain({lastA, streams[next].audio}, std::move(a), aLabel);

            chainEnd += nextDuration;
        }

        decision.chainEndAfter = chainEnd;
        qCDebug(REELFORGE_EXPORT_LOG) << "Boundary" << i << "->" << next
                                      << boundaryKindName(decision.kind) << decision.effect
                                      << "chain end" << chainEnd;
        result.boundaries.push_back(decision);
    }

    const Clip& last = clips.back();
    if (last.hasEndTransition()) {
        const Transition& t = *last.transitionEnd;
        const QString color = fadeColor(t.type);
        const double fadeOutStart = chainEnd - t.duration;
        const int index = static_cast<int>(clips.size()) - 1;

        if (fadeOutStart > 0.0) {
            std::vector<Filter> v;
            v.push_back(Filter("fade").option("t", "out").option("st", fadeOutStart)
                            .option("d", t.duration).option("color", color));
            lastV = m_graph.addChain({lastV}, std::move(v), "v_final_faded");

            std::vector<Filter> a;
            a.push_back(Filter("afade").option("t", "out").option("st", fadeOutStart)
                            .option("d", t.duration));
            lastA = m_graph.addChain({lastA}, std::move(a), "a_final_faded");

            result.boundaries.push_back({index, BoundaryKind::FadeOut, color, t.duration,
                                         fadeOutStart, chainEnd});
        } else {
            qCWarning(REELFORGE_EXPORT_LOG) << "Fade-out of" << t.duration
                                            << "s does not fit a chain of" << chainEnd << "s, skipped";
            result.boundaries.push_back({index, BoundaryKind::FadeOutSkipped, color, t.duration,
                                         fadeOutStart, chainEnd});
        }
    }

    std::vector<Filter> vTail;
    vTail.push_back(Filter("null"));
    result.video = m_graph.addChain({lastV}, std::move(vTail), "v_final");

    std::vector<Filter> aTail;
    aTail.push_back(Filter("aresample").arg(QString::number(AppConstants::AudioSampleRate)));
    result.audio = m_graph.addChain({lastA}, std::move(aTail), "a_final");

    result.chainEnd = chainEnd;
    return result;
}
