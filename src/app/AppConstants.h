#pragma once

#include <QtGlobal>

namespace AppConstants {
    inline constexpr const char* AppName = "ReelForge";
    inline constexpr const char* AppVersion = "0.1.0";
    inline constexpr const char* OrgName = "ReelForge";

    inline constexpr int DefaultPort = 3001;
    inline constexpr int ProgressIntervalMs = 500;
    inline constexpr qint64 DefaultMaxBodyBytes = 2LL * 1024 * 1024 * 1024;

    // Output frame for every export (vertical 9:16)
    inline constexpr int TargetWidth = 1080;
    inline constexpr int TargetHeight = 1920;
    inline constexpr int TargetFps = 30;
    inline constexpr int AudioSampleRate = 48000;

    // Extra source time kept on both streams of an intermediate chunk
    inline constexpr double ChunkPadding = 0.133;
    // Looped stills are opened this much longer than the trim window
    inline constexpr double ImageLoopBuffer = 0.5;

    // Changes below this are treated as "no change" for color grading
    inline constexpr double GradingEpsilon = 0.001;
}
