#pragma once

#include <QString>
#include <vector>
#include "ExportCompiler.h"
#include "MediaSource.h"

struct SpeedRampRequest {
    QString inputPath;
    int targetFps = 60;
    double speed = 0.5;     // playback rate, 0.5 = half speed
};

// Slow-motion render of one upload: motion-interpolate to the target rate,
// then stretch timestamps by 1/speed and retime the audio to match.
class SpeedRampCompiler {
public:
    SpeedRampCompiler() = default;

    bool compile(const SpeedRampRequest& request, const MediaSource& source, CompiledGraph& out);

    QString errorString() const { return m_error; }

    // atempo factors, each within [0.5, 2.0], whose product is speed
    static std::vector<double> tempoStages(double speed);
    // 1/speed with two decimals, as used by setpts
    static QString setptsFactor(double speed);

    static bool isValidSpeed(double speed);
    static bool isValidFps(int fps);

private:
    QString m_error;
};
