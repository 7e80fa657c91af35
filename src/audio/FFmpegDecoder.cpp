#include "audio/FFmpegDecoder.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cstring>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/opt.h>
#include <libswresample/swresample.h>
}

namespace folio::audio {

namespace {

std::string av_error(int code) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {};
    av_strerror(code, buf, sizeof(buf));
    return buf;
}

}  // namespace

FFmpegDecoder::~FFmpegDecoder() {
    close();
}

bool FFmpegDecoder::open(const std::string& filepath) {
    close();

    int ret = avformat_open_input(&format_ctx_, filepath.c_str(), nullptr, nullptr);
    if (ret < 0) {
        util::Logger::error("FFmpegDecoder: Failed to open " + filepath + " (" + av_error(ret) + ")");
        format_ctx_ = nullptr;
        return false;
    }

    ret = avformat_find_stream_info(format_ctx_, nullptr);
    if (ret < 0) {
        util::Logger::error("FFmpegDecoder: No stream info in " + filepath + " (" + av_error(ret) + ")");
        close();
        return false;
    }

    const AVCodec* codec = nullptr;
    audio_stream_index_ = av_find_best_stream(format_ctx_, AVMEDIA_TYPE_AUDIO, -1, -1, &codec, 0);
    if (audio_stream_index_ < 0 || !codec) {
        util::Logger::error("FFmpegDecoder: No decodable audio stream in " + filepath);
        close();
        return false;
    }

    AVStream* stream = format_ctx_->streams[audio_stream_index_];

    codec_ctx_ = avcodec_alloc_context3(codec);
    if (!codec_ctx_ ||
        avcodec_parameters_to_context(codec_ctx_, stream->codecpar) < 0 ||
        avcodec_open2(codec_ctx_, codec, nullptr) < 0) {
        util::Logger::error("FFmpegDecoder: Cannot open codec for " + filepath);
        close();
        return false;
    }

    sample_rate_ = codec_ctx_->sample_rate;
    channels_ = codec_ctx_->ch_layout.nb_channels;

    if (stream->duration != AV_NOPTS_VALUE) {
        total_frames_ = static_cast<int64_t>(stream->duration * av_q2d(stream->time_base) * sample_rate_);
    } else if (format_ctx_->duration != AV_NOPTS_VALUE) {
        total_frames_ = static_cast<int64_t>(format_ctx_->duration / static_cast<double>(AV_TIME_BASE) * sample_rate_);
    }

    AVChannelLayout out_layout;
    av_channel_layout_default(&out_layout, channels_);
    ret = swr_alloc_set_opts2(&swr_ctx_,
                              &out_layout, AV_SAMPLE_FMT_FLT, sample_rate_,
                              &codec_ctx_->ch_layout, codec_ctx_->sample_fmt, sample_rate_,
                              0, nullptr);
    av_channel_layout_uninit(&out_layout);
    if (ret < 0 || swr_init(swr_ctx_) < 0) {
        util::Logger::error("FFmpegDecoder: Cannot set up sample conversion for " + filepath);
        close();
        return false;
    }

    packet_ = av_packet_alloc();
    frame_ = av_frame_alloc();
    if (!packet_ || !frame_) {
        util::Logger::error("FFmpegDecoder: Out of memory");
        close();
        return false;
    }

    position_frames_ = 0;
    util::Logger::debug("FFmpegDecoder: Opened " + filepath + " (" + std::to_string(sample_rate_) + "Hz, " +
                        std::to_string(channels_) + "ch, " + std::to_string(total_frames_) + " frames)");
    return true;
}

void FFmpegDecoder::close() {
    pending_.clear();
    pending_offset_ = 0;

    if (frame_) av_frame_free(&frame_);
    if (packet_) av_packet_free(&packet_);
    if (swr_ctx_) swr_free(&swr_ctx_);
    if (codec_ctx_) avcodec_free_context(&codec_ctx_);
    if (format_ctx_) avformat_close_input(&format_ctx_);

    audio_stream_index_ = -1;
    sample_rate_ = 0;
    channels_ = 0;
    total_frames_ = 0;
    position_frames_ = 0;
}

bool FFmpegDecoder::decode_next() {
    while (true) {
        int ret = avcodec_receive_frame(codec_ctx_, frame_);
        if (ret == 0) {
            pending_.resize(static_cast<size_t>(frame_->nb_samples) * channels_);
            auto* out = reinterpret_cast<uint8_t*>(pending_.data());
            int converted = swr_convert(swr_ctx_, &out, frame_->nb_samples,
                                        const_cast<const uint8_t**>(frame_->extended_data),
                                        frame_->nb_samples);
            av_frame_unref(frame_);
            if (converted < 0) {
                util::Logger::warn("FFmpegDecoder: Sample conversion failed, dropping frame");
                pending_.clear();
                continue;
            }
            pending_.resize(static_cast<size_t>(converted) * channels_);
            pending_offset_ = 0;
            return true;
        }
        if (ret == AVERROR_EOF) {
            return false;
        }
        if (ret != AVERROR(EAGAIN)) {
            util::Logger::error("FFmpegDecoder: Decode error (" + av_error(ret) + ")");
            return false;
        }

        // Decoder wants more input
        ret = av_read_frame(format_ctx_, packet_);
        if (ret < 0) {
            avcodec_send_packet(codec_ctx_, nullptr);  // Enter draining mode
            continue;
        }
        if (packet_->stream_index == audio_stream_index_) {
            ret = avcodec_send_packet(codec_ctx_, packet_);
            if (ret < 0 && ret != AVERROR(EAGAIN)) {
                util::Logger::warn("FFmpegDecoder: Dropping bad packet (" + av_error(ret) + ")");
            }
        }
        av_packet_unref(packet_);
    }
}

int FFmpegDecoder::read_pcm(float* buffer, int max_frames) {
    if (!format_ctx_ || !buffer || max_frames <= 0) return 0;

    int written = 0;
    while (written < max_frames) {
        size_t available = (pending_.size() - pending_offset_) / channels_;
        if (available == 0) {
            if (!decode_next()) break;
            continue;
        }

        int to_copy = static_cast<int>(std::min<size_t>(available, max_frames - written));
        std::memcpy(buffer + static_cast<size_t>(written) * channels_,
                    pending_.data() + pending_offset_,
                    static_cast<size_t>(to_copy) * channels_ * sizeof(float));
        pending_offset_ += static_cast<size_t>(to_copy) * channels_;
        written += to_copy;
    }

    position_frames_ += written;
    return written;
}

bool FFmpegDecoder::seek(int64_t frame) {
    if (!format_ctx_ || audio_stream_index_ < 0) return false;

    AVStream* stream = format_ctx_->streams[audio_stream_index_];
    int64_t timestamp = av_rescale_q(frame, AVRational{1, sample_rate_}, stream->time_base);

    int ret = av_seek_frame(format_ctx_, audio_stream_index_, timestamp, AVSEEK_FLAG_BACKWARD);
    if (ret < 0) {
        util::Logger::error("FFmpegDecoder: Seek failed (" + av_error(ret) + ")");
        return false;
    }

    avcodec_flush_buffers(codec_ctx_);
    pending_.clear();
    pending_offset_ = 0;
    position_frames_ = frame;
    return true;
}

}  // namespace folio::audio
