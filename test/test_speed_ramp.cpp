#include <cassert>
#include <cstdio>
#include <cmath>
#include <limits>
#include "export/SpeedRampCompiler.h"

static bool near(double a, double b) { return std::abs(a - b) < 1e-9; }

static MediaSource clipSource(bool hasAudio) {
    MediaSource src;
    src.id = "input";
    src.path = "/uploads/process-1/input.mp4";
    src.kind = MediaKind::Video;
    src.duration = 10.0;
    src.hasVideo = true;
    src.hasAudio = hasAudio;
    return src;
}

static bool hasChain(const CompiledGraph& graph, const QString& text) {
    for (const auto& chain : graph.graph.chains()) {
        if (chain.serialize() == text) return true;
    }
    return false;
}

static double product(const std::vector<double>& stages) {
    double p = 1.0;
    for (double s : stages) p *= s;
    return p;
}

void test_tempo_stages() {
    assert(SpeedRampCompiler::tempoStages(0.5) == std::vector<double>({0.5}));
    assert(SpeedRampCompiler::tempoStages(0.25) == std::vector<double>({0.5, 0.5}));
    assert(SpeedRampCompiler::tempoStages(2.0) == std::vector<double>({2.0}));
    assert(SpeedRampCompiler::tempoStages(4.0) == std::vector<double>({2.0, 2.0}));
    assert(SpeedRampCompiler::tempoStages(0.75) == std::vector<double>({0.75}));
    assert(SpeedRampCompiler::tempoStages(1.0) == std::vector<double>({1.0}));

    for (double speed : {0.1, 0.3, 0.6, 1.7, 3.0, 9.0}) {
        std::vector<double> stages = SpeedRampCompiler::tempoStages(speed);
        assert(!stages.empty());
        for (double s : stages) {
            assert(s >= 0.5 - 1e-12 && s <= 2.0 + 1e-12);
        }
        assert(std::abs(product(stages) - speed) < 1e-9);
    }
    assert(SpeedRampCompiler::tempoStages(0.0).empty());
    printf("PASS: test_tempo_stages\n");
}

void test_setpts_factor() {
    assert(SpeedRampCompiler::setptsFactor(0.5) == "2.00");
    assert(SpeedRampCompiler::setptsFactor(0.25) == "4.00");
    assert(SpeedRampCompiler::setptsFactor(0.3) == "3.33");
    assert(SpeedRampCompiler::setptsFactor(2.0) == "0.50");
    printf("PASS: test_setpts_factor\n");
}

void test_compile_with_audio() {
    SpeedRampRequest request;
    request.inputPath = "/uploads/process-1/input.mp4";
    request.targetFps = 60;
    request.speed = 0.5;

    SpeedRampCompiler compiler;
    CompiledGraph out;
    bool ok = compiler.compile(request, clipSource(true), out);
    assert(ok);
    assert(near(out.expectedDuration, 20.0));
    assert(hasChain(out, "[0:v]minterpolate=fps=60:mi_mode=mci:mc_mode=aobmc:me_mode=bidir:vsbmc=1:scd=fdiff,"
                         "setpts=2.00*PTS[v]"));
    assert(hasChain(out, "[0:a]atempo=0.5,volume=0.98,aresample=48000:async=1[a]"));

    OutputSettings settings;
    settings.profile = OutputProfile::SpeedRamp;
    settings.threads = 3;
    QStringList args = out.toInvocation("/outputs/processed-1.mp4", settings).arguments();
    assert(args.contains("-max_muxing_queue_size"));
    assert(args[args.indexOf("-threads") + 1] == "3");
    assert(args[args.indexOf("-c:a") + 1] == "aac");
    assert(args[args.indexOf("-b:a") + 1] == "320k");
    assert(args.count("-map") == 2);
    printf("PASS: test_compile_with_audio\n");
}

void test_compile_silent_source() {
    SpeedRampRequest request;
    request.targetFps = 120;
    request.speed = 0.25;

    SpeedRampCompiler compiler;
    CompiledGraph out;
    bool ok = compiler.compile(request, clipSource(false), out);
    assert(ok);
    assert(out.audioOutput.isEmpty());
    assert(out.inputs[0].path == "/uploads/process-1/input.mp4");
    assert(near(out.expectedDuration, 40.0));

    QStringList args = out.toInvocation("/outputs/p.mp4", OutputSettings()).arguments();
    assert(args.count("-map") == 1);
    assert(!out.graph.serialize().contains("atempo"));
    printf("PASS: test_compile_silent_source\n");
}

void test_invalid_requests() {
    SpeedRampCompiler compiler;
    CompiledGraph out;
    SpeedRampRequest request;

    request.speed = 0.0;
    bool ok = compiler.compile(request, clipSource(true), out);
    assert(!ok);
    assert(compiler.errorString().contains("speed"));

    request.speed = std::numeric_limits<double>::quiet_NaN();
    ok = compiler.compile(request, clipSource(true), out);
    assert(!ok);

    request.speed = 0.5;
    request.targetFps = 0;
    ok = compiler.compile(request, clipSource(true), out);
    assert(!ok);

    request.targetFps = 60;
    MediaSource audioOnly = clipSource(true);
    audioOnly.hasVideo = false;
    ok = compiler.compile(request, audioOnly, out);
    assert(!ok);

    MediaSource noDuration = clipSource(true);
    noDuration.duration = 0.0;
    ok = compiler.compile(request, noDuration, out);
    assert(!ok);
    assert(compiler.errorString() == "Failed to read video metadata");
    printf("PASS: test_invalid_requests\n");
}

int main() {
    test_tempo_stages();
    test_setpts_factor();
    test_compile_with_audio();
    test_compile_silent_source();
    test_invalid_requests();
    printf("All speed ramp tests passed.\n");
    return 0;
}
