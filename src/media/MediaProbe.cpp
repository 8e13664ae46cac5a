#include "MediaProbe.h"
#include <QFileInfo>
#include <QStringList>

#ifdef HAS_FFMPEG
extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
}
#endif

namespace {

const QStringList kImageSuffixes = {"jpg", "jpeg", "png", "webp", "bmp", "gif"};

#ifdef HAS_FFMPEG
bool isStillImageDemuxer(const char* name) {
    if (!name) return false;
    QString demuxer = QString::fromLatin1(name);
    return demuxer == "image2" || demuxer.endsWith("_pipe");
}
#endif

} // namespace

bool MediaProbe::probe(const QString& filePath) {
    m_info = MediaInfo{};
    m_info.filePath = filePath;
    m_error.clear();

    if (!QFileInfo::exists(filePath)) {
        m_error = QString("Media file not found: %1").arg(filePath);
        return false;
    }

#ifdef HAS_FFMPEG
    AVFormatContext* fmtCtx = nullptr;
    int ret = avformat_open_input(&fmtCtx, filePath.toUtf8().constData(), nullptr, nullptr);
    if (ret < 0) {
        char errBuf[256];
        av_strerror(ret, errBuf, sizeof(errBuf));
        m_error = QString("Cannot open file: %1 (%2)").arg(filePath, errBuf);
        return false;
    }

    ret = avformat_find_stream_info(fmtCtx, nullptr);
    if (ret < 0) {
        m_error = QString("Failed to read media metadata: %1").arg(filePath);
        avformat_close_input(&fmtCtx);
        return false;
    }

    m_info.isStillImage = isStillImageDemuxer(fmtCtx->iformat->name);
    m_info.duration = (fmtCtx->duration > 0)
        ? static_cast<double>(fmtCtx->duration) / AV_TIME_BASE
        : 0.0;

    for (unsigned i = 0; i < fmtCtx->nb_streams; ++i) {
        AVStream* stream = fmtCtx->streams[i];
        AVCodecParameters* par = stream->codecpar;

        // Cover art attached to audio files is not a video stream
        if (par->codec_type == AVMEDIA_TYPE_VIDEO && !(stream->disposition & AV_DISPOSITION_ATTACHED_PIC)) {
            m_info.hasVideo = true;
        } else if (par->codec_type == AVMEDIA_TYPE_AUDIO) {
            m_info.hasAudio = true;
        }
    }

    avformat_close_input(&fmtCtx);

    if (!m_info.hasVideo && !m_info.hasAudio) {
        m_error = QString("No audio or video stream in: %1").arg(filePath);
        return false;
    }
    return true;
#else
    m_error = "FFmpeg not available";
    return false;
#endif
}

MediaSource MediaProbe::toMediaSource(const QString& id, const QString& contentType) const {
    MediaSource source;
    source.id = id;
    source.path = m_info.filePath;
    source.duration = m_info.duration;
    source.hasVideo = m_info.hasVideo;
    source.hasAudio = m_info.hasAudio;

    if (m_info.isStillImage || isImagePath(m_info.filePath) || isImageContentType(contentType)) {
        source.kind = MediaKind::Image;
        source.hasAudio = false;
        source.hasVideo = true;
    } else if (!m_info.hasVideo) {
        source.kind = MediaKind::Audio;
    } else {
        source.kind = MediaKind::Video;
    }
    return source;
}

bool MediaProbe::isImagePath(const QString& filePath) {
    return kImageSuffixes.contains(QFileInfo(filePath).suffix().toLower());
}

bool MediaProbe::isImageContentType(const QString& contentType) {
    return contentType.trimmed().toLower().startsWith("image/");
}

QString MediaProbe::extensionForContentType(const QString& contentType) {
    QString type = contentType.section(';', 0, 0).trimmed().toLower();
    if (type == "image/jpeg" || type == "image/jpg") return "jpg";
    if (type == "image/png") return "png";
    if (type == "image/webp") return "webp";
    if (type == "image/bmp") return "bmp";
    if (type == "image/gif") return "gif";
    if (type == "video/mp4") return "mp4";
    if (type == "video/quicktime") return "mov";
    if (type == "video/webm") return "webm";
    if (type == "video/x-matroska") return "mkv";
    if (type == "audio/mpeg") return "mp3";
    if (type == "audio/wav" || type == "audio/x-wav" || type == "audio/wave") return "wav";
    if (type == "audio/aac") return "aac";
    if (type == "audio/mp4" || type == "audio/x-m4a") return "m4a";
    if (type == "audio/ogg") return "ogg";
    return QString();
}
