#pragma once

#include <QString>
#include <QStringList>
#include <vector>

enum class OutputProfile {
    FinalExport,        // H.264/AAC delivery file
    IntermediateChunk,  // ProRes 422 HQ / PCM, 10-bit 4:2:2
    SpeedRamp           // slow-motion render of a single upload
};

enum class VideoCodec {
    H264,
    Hevc
};

struct OutputSettings {
    OutputProfile profile = OutputProfile::FinalExport;
    QString container = "mp4";
    VideoCodec videoCodec = VideoCodec::H264;
    int threads = 0;            // 0 = let the encoder decide
    bool shortest = false;      // stop at the shortest mapped stream
};

bool containerFromName(const QString& name, QString& container);
bool videoCodecFromName(const QString& name, VideoCodec& codec);

// One -i entry, with the options that precede it (e.g. -loop 1 -t 5.5)
struct EncoderInput {
    QString path;
    QStringList options;
};

// Everything the encoder process needs for one artifact
struct EncoderInvocation {
    std::vector<EncoderInput> inputs;
    QString filterComplex;
    QStringList maps;               // pad labels, without brackets
    QStringList outputOptions;
    QString outputPath;
    double expectedDuration = 0.0;  // seconds of output, for progress
    QStringList transientPaths;     // deleted once the job is over

    QStringList arguments() const;
};

class EncoderProfile {
public:
    static QStringList outputOptions(const OutputSettings& settings);
};
