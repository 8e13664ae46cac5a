#include "SpeedRampCompiler.h"
#include "AppConstants.h"
#include "Logging.h"

#include <cmath>

namespace {
constexpr double kMinTempo = 0.5;
constexpr double kMaxTempo = 2.0;
constexpr double kMaxSpeed = 100.0;
constexpr int kMaxFps = 240;
}

bool SpeedRampCompiler::isValidSpeed(double speed) {
    return std::isfinite(speed) && speed > 0.0 && speed <= kMaxSpeed;
}

bool SpeedRampCompiler::isValidFps(int fps) {
    return fps > 0 && fps <= kMaxFps;
}

std::vector<double> SpeedRampCompiler::tempoStages(double speed) {
    std::vector<double> stages;
    if (!isValidSpeed(speed)) return stages;

    double remainder = speed;
    while (remainder < kMinTempo) {
        stages.push_back(kMinTempo);
        remainder /= kMinTempo;
    }
    while (remainder > kMaxTempo) {
        stages.push_back(kMaxTempo);
        remainder /= kMaxTempo;
    }
    // An exact multiple leaves a unit remainder, which is a no-op stage
    if (stages.empty() || std::abs(remainder - 1.0) > 1e-9) {
        stages.push_back(remainder);
    }
    return stages;
}

QString SpeedRampCompiler::setptsFactor(double speed) {
    return FilterGraph::formatFixed(1.0 / speed, 2);
}

bool SpeedRampCompiler::compile(const SpeedRampRequest& request, const MediaSource& source,
                                CompiledGraph& out) {
    m_error.clear();
    out = CompiledGraph();

    if (!isValidSpeed(request.speed)) {
        m_error = QString("Invalid speed %1").arg(request.speed);
        return false;
    }
    if (!isValidFps(request.targetFps)) {
        m_error = QString("Invalid target frame rate %1").arg(request.targetFps);
        return false;
    }
    if (!source.hasVideo) {
        m_error = "Input has no video stream";
        return false;
    }
    if (source.duration <= 0.0) {
        m_error = "Failed to read video metadata";
        return false;
    }

    EncoderInput input;
    input.path = request.inputPath.isEmpty() ? source.path : request.inputPath;
    out.inputs.push_back(input);

    // Interpolate first so the stretched stream has frames to show
    std::vector<Filter> video;
    video.push_back(Filter("minterpolate")
                        .option("fps", QString::number(request.targetFps))
                        .option("mi_mode", "mci")
                        .option("mc_mode", "aobmc")
                        .option("me_mode", "bidir")
                        .option("vsbmc", "1")
                        .option("scd", "fdiff"));
    video.push_back(Filter("setpts").arg(setptsFactor(request.speed) + "*PTS"));
    out.videoOutput = out.graph.addChain({"0:v"}, std::move(video), "v");

    if (source.hasAudio) {
        std::vector<Filter> audio;
        for (double tempo : tempoStages(request.speed)) {
            audio.push_back(Filter("atempo").arg(tempo));
        }
        audio.push_back(Filter("volume").arg("0.98"));
        audio.push_back(Filter("aresample")
                            .arg(QString::number(AppConstants::AudioSampleRate))
                            .option("async", "1"));
        out.audioOutput = out.graph.addChain({"0:a"}, std::move(audio), "a");
    }

    out.expectedDuration = source.duration / request.speed;

    qCInfo(REELFORGE_EXPORT_LOG) << "Speed ramp" << request.speed << "x at" << request.targetFps
                                 << "fps, expected duration" << out.expectedDuration << "s";
    return true;
}
