#include "ClipGraphBuilder.h"
#include "AppConstants.h"
#include "Logging.h"

#include <cmath>

using namespace AppConstants;

namespace {

Filter scaleToCover() {
    return Filter("scale")
        .arg(QString::number(TargetWidth))
        .arg(QString::number(TargetHeight))
        .option("force_original_aspect_ratio", "increase");
}

} // namespace

ClipGraphBuilder::ClipGraphBuilder(FilterGraph& graph, ClipRenderMode mode)
    : m_graph(graph), m_mode(mode) {}

ClipStreams ClipGraphBuilder::build(const Clip& clip, const MediaSource& source, int inputIndex,
                                    double trackVolume, bool trackMuted) {
    ClipStreams streams;
    streams.duration = clip.duration();
    streams.video = buildVideo(clip, inputIndex);
    streams.audio = buildAudio(clip, source, inputIndex,
                               effectiveVolume(clip, trackVolume, trackMuted));

    qCDebug(REELFORGE_EXPORT_LOG) << "Clip" << inputIndex << clip.id
                                  << "start" << clip.sourceStart << "end" << clip.sourceEnd
                                  << "duration" << streams.duration
                                  << "kind" << mediaKindName(source.kind);
    return streams;
}

double ClipGraphBuilder::trimDuration(const Clip& clip) const {
    double duration = clip.duration();
    if (m_mode == ClipRenderMode::IntermediateChunk) duration += ChunkPadding;
    return duration;
}

EncoderInput ClipGraphBuilder::inputFor(const Clip& clip, const MediaSource& source) const {
    EncoderInput input;
    input.path = source.path;
    if (source.kind == MediaKind::Image) {
        // A still yields one frame; loop it past the end of the trim window
        double length = clip.sourceStart + trimDuration(clip) + ImageLoopBuffer;
        input.options << "-loop" << "1" << "-t" << FilterGraph::formatNumber(length);
    }
    return input;
}

double ClipGraphBuilder::effectiveVolume(const Clip& clip, double trackVolume, bool trackMuted) {
    if (trackMuted || clip.isMuted) return 0.0;
    return trackVolume * clip.volume;
}

std::vector<Filter> ClipGraphBuilder::reframeFilters(const Clip& clip) {
    std::vector<Filter> filters;
    filters.push_back(scaleToCover());

    QString cropY = QString("(ih-%1)/2").arg(TargetHeight);
    QString cropX;
    if (clip.reframeKeyframes.empty()) {
        cropX = QString("(iw-%1)/2").arg(TargetWidth);
    } else {
        // Static pan: the window is centred on the mean keyframe x and kept
        // inside the frame. Keyframe y and scale do not reach the export.
        double avgX = averageKeyframeX(clip.reframeKeyframes);
        cropX = QString("max(0,min(iw-%1,(%2*iw)-(%1/2)))")
                    .arg(TargetWidth)
                    .arg(FilterGraph::formatNumber(avgX));
    }

    filters.push_back(Filter("crop")
                          .arg(QString::number(TargetWidth))
                          .arg(QString::number(TargetHeight))
                          .arg(cropX)
                          .arg(cropY));
    return filters;
}

std::vector<Filter> ClipGraphBuilder::gradingFilters(const ColorGrading& grading) {
    std::vector<Filter> filters;

    const double brightness = grading.effectiveBrightness();
    Filter eq("eq");
    if (std::abs(brightness) > GradingEpsilon) {
        eq.option("brightness", FilterGraph::formatFixed(brightness, 3));
    }
    if (std::abs(grading.contrast - 1.0) > GradingEpsilon) {
        eq.option("contrast", FilterGraph::formatFixed(grading.contrast, 3));
    }
    if (std::abs(grading.saturation - 1.0) > GradingEpsilon) {
        eq.option("saturation", FilterGraph::formatFixed(grading.saturation, 3));
    }
    if (!eq.options().empty()) filters.push_back(eq);

    if (grading.sharpness > 0.0) {
        QString amount = FilterGraph::formatFixed(grading.sharpness * 1.5, 2);
        filters.push_back(Filter("unsharp")
                              .arg("5").arg("5").arg(amount)
                              .arg("5").arg("5").arg("0.0"));
    }
    return filters;
}

QString ClipGraphBuilder::buildVideo(const Clip& clip, int inputIndex) {
    std::vector<Filter> filters;

    filters.push_back(Filter("trim")
                          .option("start", clip.sourceStart)
                          .option("duration", trimDuration(clip)));
    filters.push_back(Filter("setpts").arg("PTS-STARTPTS"));

    for (auto& f : reframeFilters(clip)) {
        filters.push_back(std::move(f));
    }

    filters.push_back(Filter("setsar").arg("1"));
    filters.push_back(Filter("fps").arg(QString::number(TargetFps)));
    if (m_mode == ClipRenderMode::IntermediateChunk) {
        // Regenerate timestamps so every chunk is exactly CFR
        filters.push_back(Filter("setpts").arg(QString("N/%1/TB").arg(TargetFps)));
    } else {
        filters.push_back(Filter("format").arg("yuv420p"));
    }

    if (clip.colorGrading && !clip.colorGrading->isNeutral()) {
        for (auto& f : gradingFilters(*clip.colorGrading)) {
            filters.push_back(std::move(f));
        }
    }

    return m_graph.addChain({QString("%1:v").arg(inputIndex)}, std::move(filters),
                            QString("v%1").arg(inputIndex));
}

QString ClipGraphBuilder::buildAudio(const Clip& clip, const MediaSource& source, int inputIndex,
                                     double volume) {
    const QString label = QString("a%1").arg(inputIndex);
    const double duration = trimDuration(clip);

    if (!source.hasAudio) {
        // Stills and silent videos: synthesize silence for the trimmed length
        std::vector<Filter> silence;
        silence.push_back(Filter("anullsrc")
                              .option("channel_layout", "stereo")
                              .option("sample_rate", QString::number(AudioSampleRate))
                              .option("duration", duration));
        if (m_mode == ClipRenderMode::IntermediateChunk) {
            return m_graph.addChain({}, std::move(silence), label);
        }
        QString raw = m_graph.addChain({}, std::move(silence), label + "_raw");
        std::vector<Filter> gain;
        gain.push_back(Filter("volume").arg(volume));
        return m_graph.addChain({raw}, std::move(gain), label);
    }

    std::vector<Filter> filters;
    filters.push_back(Filter("atrim")
                          .option("start", clip.sourceStart)
                          .option("duration", duration));
    filters.push_back(Filter("asetpts").arg("PTS-STARTPTS"));

    if (m_mode == ClipRenderMode::IntermediateChunk) {
        filters.push_back(Filter("apad").option("pad_dur", ChunkPadding));
        filters.push_back(Filter("aresample").arg(QString::number(AudioSampleRate)));
        if (volume != 1.0) filters.push_back(Filter("volume").arg(volume));
        // Soft limiter instead of loudness normalisation
        filters.push_back(Filter("alimiter")
                              .option("limit", "0.95")
                              .option("attack", "5")
                              .option("release", "50")
                              .option("asc", "1"));
    } else {
        filters.push_back(Filter("aresample").arg(QString::number(AudioSampleRate)));
        filters.push_back(Filter("volume").arg(volume));
    }

    return m_graph.addChain({QString("%1:a").arg(inputIndex)}, std::move(filters), label);
}
