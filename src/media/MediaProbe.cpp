#include "MediaProbe.h"
#include "ConversionLog.h"

#ifdef HAS_FFMPEG
extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/dict.h>
}
#endif

MediaProbe::MediaProbe(QObject* parent) : QObject(parent) {}
MediaProbe::~MediaProbe() = default;

bool MediaProbe::probe(const QString& filePath) {
    m_info = MediaInfo{};
    m_info.filePath = filePath;
    m_error.clear();

#ifdef HAS_FFMPEG
    AVFormatContext* fmtCtx = nullptr;
    int ret = avformat_open_input(&fmtCtx, filePath.toUtf8().constData(), nullptr, nullptr);
    if (ret < 0) {
        char errBuf[256];
        av_strerror(ret, errBuf, sizeof(errBuf));
        m_error = QString("Cannot open file: %1 (%2)").arg(filePath, errBuf);
        qCDebug(lcMedia) << m_error;
        return false;
    }

    ret = avformat_find_stream_info(fmtCtx, nullptr);
    if (ret < 0) {
        m_error = "Cannot find stream info";
        avformat_close_input(&fmtCtx);
        return false;
    }

    m_info.containerFormat = QString(fmtCtx->iformat->long_name);
    m_info.duration = (fmtCtx->duration > 0)
        ? static_cast<double>(fmtCtx->duration) / AV_TIME_BASE
        : 0.0;

    const AVDictionaryEntry* tag = nullptr;
    while ((tag = av_dict_get(fmtCtx->metadata, "", tag, AV_DICT_IGNORE_SUFFIX))) {
        m_info.metadata.insert(QString(tag->key), QString::fromUtf8(tag->value));
    }

    for (unsigned i = 0; i < fmtCtx->nb_streams; ++i) {
        AVStream* stream = fmtCtx->streams[i];
        AVCodecParameters* par = stream->codecpar;
        if (par->codec_type != AVMEDIA_TYPE_AUDIO) continue;

        m_info.hasAudio = true;
        m_info.audioSampleRate = par->sample_rate;
        m_info.audioChannels = par->ch_layout.nb_channels;
        m_info.audioBitRate = static_cast<int>(par->bit_rate);

        const AVCodecDescriptor* desc = avcodec_descriptor_get(par->codec_id);
        m_info.audioCodec = desc ? QString(desc->name) : "unknown";

        // Stream duration when the container does not carry one
        if (m_info.duration <= 0.0 && stream->duration > 0) {
            m_info.duration = stream->duration * av_q2d(stream->time_base);
        }
        break;
    }

    avformat_close_input(&fmtCtx);

    if (!m_info.hasAudio) {
        m_error = QString("No audio stream: %1").arg(filePath);
        qCDebug(lcMedia) << m_error;
        return false;
    }
    return true;
#else
    m_error = "FFmpeg not available";
    return false;
#endif
}
