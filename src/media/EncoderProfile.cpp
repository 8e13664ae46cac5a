#include "EncoderProfile.h"
#include "AppConstants.h"

namespace {

QStringList audioOptions(const char* codec, const char* bitrate) {
    QStringList args = {"-c:a", codec};
    if (bitrate) args << "-b:a" << bitrate;
    args << "-ar" << QString::number(AppConstants::AudioSampleRate) << "-ac" << "2";
    return args;
}

bool supportsFaststart(const QString& container) {
    return container == "mp4" || container == "mov";
}

} // namespace

bool containerFromName(const QString& name, QString& container) {
    QString lower = name.trimmed().toLower();
    if (lower.isEmpty()) lower = "mp4";
    if (lower == "mp4" || lower == "mov" || lower == "mkv") {
        container = lower;
        return true;
    }
    return false;
}

bool videoCodecFromName(const QString& name, VideoCodec& codec) {
    QString lower = name.trimmed().toLower();
    if (lower.isEmpty() || lower == "h264" || lower == "libx264") {
        codec = VideoCodec::H264;
        return true;
    }
    if (lower == "hevc" || lower == "h265" || lower == "libx265") {
        codec = VideoCodec::Hevc;
        return true;
    }
    return false;
}

QStringList EncoderInvocation::arguments() const {
    QStringList args = {"-y", "-hide_banner", "-nostats", "-loglevel", "error",
                        "-progress", "pipe:1"};

    for (const auto& input : inputs) {
        args << input.options;
        args << "-i" << input.path;
    }
    if (!filterComplex.isEmpty()) {
        args << "-filter_complex" << filterComplex;
    }
    for (const auto& label : maps) {
        args << "-map" << QString("[%1]").arg(label);
    }
    args << outputOptions;
    args << outputPath;
    return args;
}

QStringList EncoderProfile::outputOptions(const OutputSettings& settings) {
    QStringList args;

    switch (settings.profile) {
    case OutputProfile::FinalExport:
        if (settings.videoCodec == VideoCodec::Hevc) {
            args << "-c:v" << "libx265"
                 << "-preset" << "medium"
                 << "-crf" << "20"
                 << "-tag:v" << "hvc1";
        } else {
            args << "-c:v" << "libx264"
                 << "-preset" << "medium"
                 << "-crf" << "18"
                 << "-maxrate" << "15M"
                 << "-bufsize" << "30M"
                 << "-profile:v" << "high"
                 << "-level" << "4.2";
        }
        args << "-pix_fmt" << "yuv420p"
             << "-g" << "60";
        if (supportsFaststart(settings.container)) args << "-movflags" << "+faststart";
        args << audioOptions("aac", "320k");
        break;

    case OutputProfile::IntermediateChunk:
        args << "-r" << QString::number(AppConstants::TargetFps)
             << "-vsync" << "cfr"
             << "-c:v" << "prores_ks"
             << "-profile:v" << "3"
             << "-pix_fmt" << "yuv422p10le"
             << "-vendor" << "ap10";
        args << audioOptions("pcm_s16le", nullptr);
        break;

    case OutputProfile::SpeedRamp:
        args << "-c:v" << (settings.videoCodec == VideoCodec::Hevc ? "libx265" : "libx264")
             << "-pix_fmt" << "yuv420p";
        if (supportsFaststart(settings.container)) args << "-movflags" << "+faststart";
        args << "-max_muxing_queue_size" << "9999";
        args << audioOptions("aac", "320k");
        break;
    }

    if (settings.shortest) args << "-shortest";
    if (settings.threads > 0) args << "-threads" << QString::number(settings.threads);
    return args;
}
