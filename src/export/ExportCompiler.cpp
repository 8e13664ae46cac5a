#include "ExportCompiler.h"
#include "AppConstants.h"
#include "AudioMixStage.h"
#include "ClipGraphBuilder.h"
#include "Logging.h"

EncoderInvocation CompiledGraph::toInvocation(const QString& outputPath, OutputSettings settings) const {
    EncoderInvocation invocation;
    invocation.inputs = inputs;
    invocation.filterComplex = graph.serialize();
    invocation.maps << videoOutput;
    if (!audioOutput.isEmpty()) invocation.maps << audioOutput;
    if (shortestOutput) settings.shortest = true;
    invocation.outputOptions = EncoderProfile::outputOptions(settings);
    invocation.outputPath = outputPath;
    invocation.expectedDuration = expectedDuration;
    return invocation;
}

bool ExportCompiler::resolve(const Clip& clip, const MediaLibrary& media, const MediaSource*& source) {
    // A finished slow-motion render replaces the uploaded file
    auto it = media.end();
    if (!clip.processedVideoUrl.isEmpty()) it = media.find(clip.processedVideoUrl);
    if (it == media.end()) it = media.find(clip.mediaFileId);

    if (it == media.end()) {
        m_error = QString("Media file not found for clip %1").arg(clip.id);
        return false;
    }
    source = &it.value();
    return true;
}

bool ExportCompiler::compile(const Timeline& timeline, const MediaLibrary& media, CompiledGraph& out) {
    m_error.clear();
    out = CompiledGraph();

    if (timeline.layout() != TemplateLayout::Solo) {
        m_error = QString("Unsupported template layout '%1': only solo is supported")
                      .arg(layoutName(timeline.layout()));
        return false;
    }
    if (timeline.videoTracks().size() != 1) {
        m_error = QString("Solo layout needs exactly one video track, got %1")
                      .arg(timeline.videoTracks().size());
        return false;
    }

    const Track& track = timeline.videoTracks().front();
    if (track.clipCount() == 0) {
        m_error = "No clips to export";
        return false;
    }
    QString trackError;
    if (!track.validate(&trackError)) {
        m_error = trackError;
        return false;
    }

    ClipGraphBuilder clipBuilder(out.graph);
    std::vector<ClipStreams> streams;
    streams.reserve(track.clips().size());

    for (int i = 0; i < track.clipCount(); ++i) {
        const Clip& clip = track.clip(i);
        const MediaSource* source = nullptr;
        if (!resolve(clip, media, source)) return false;
        if (!source->hasVideo) {
            m_error = QString("Media file for clip %1 has no video stream").arg(clip.id);
            return false;
        }

        out.inputs.push_back(clipBuilder.inputFor(clip, *source));
        streams.push_back(clipBuilder.build(clip, *source, i, track.volume(), track.isMuted()));
    }

    TransitionChainBuilder chainBuilder(out.graph);
    ChainResult chain = chainBuilder.fold(track.clips(), streams);

    out.videoOutput = chain.video;
    out.expectedDuration = chain.chainEnd;
    out.boundaries = chain.boundaries;

    if (!mixMusic(timeline, media, out, chain.audio)) return false;

    qCInfo(REELFORGE_EXPORT_LOG) << "Compiled" << track.clipCount() << "clips,"
                                 << out.inputs.size() << "inputs, expected duration"
                                 << out.expectedDuration << "s";
    return true;
}

bool ExportCompiler::mixMusic(const Timeline& timeline, const MediaLibrary& media, CompiledGraph& out,
                              const QString& masterAudio) {
    AudioMixStage mix(out.graph, masterAudio);

    for (const Track& track : timeline.audioTracks()) {
        if (track.isMuted()) {
            qCDebug(REELFORGE_EXPORT_LOG) << "Audio track" << track.id() << "muted, skipped";
            continue;
        }
        QString trackError;
        if (!track.validate(&trackError)) {
            m_error = trackError;
            return false;
        }
        for (const Clip& clip : track.clips()) {
            if (clip.isMuted) continue;

            const MediaSource* source = nullptr;
            if (!resolve(clip, media, source)) return false;
            if (!source->hasAudio) {
                qCWarning(REELFORGE_EXPORT_LOG) << "Music clip" << clip.id << "has no audio stream, skipped";
                continue;
            }

            const int inputIndex = static_cast<int>(out.inputs.size());
            EncoderInput input;
            input.path = source->path;
            out.inputs.push_back(input);
            mix.addClip(clip, track.volume(), inputIndex);
        }
    }

    out.audioOutput = mix.finish();
    return true;
}

bool ExportCompiler::compileChunk(const Clip& clip, const MediaSource& source, double trackVolume,
                                  bool trackMuted, CompiledGraph& out) {
    m_error.clear();
    out = CompiledGraph();

    if (clip.duration() <= 0.0) {
        m_error = QString("Clip %1 has an empty trim window").arg(clip.id);
        return false;
    }
    if (!source.hasVideo) {
        m_error = QString("Media file for clip %1 has no video stream").arg(clip.id);
        return false;
    }

    ClipGraphBuilder builder(out.graph, ClipRenderMode::IntermediateChunk);
    out.inputs.push_back(builder.inputFor(clip, source));
    ClipStreams streams = builder.build(clip, source, 0, trackVolume, trackMuted);

    out.videoOutput = streams.video;
    out.audioOutput = streams.audio;
    out.expectedDuration = builder.trimDuration(clip);
    // Synthesized silence has its own length; stop with the video
    out.shortestOutput = !source.hasAudio;
    return true;
}
