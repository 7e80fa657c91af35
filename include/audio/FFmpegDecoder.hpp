#pragma once

#include "audio/AudioDecoder.hpp"
#include <vector>

struct AVFormatContext;
struct AVCodecContext;
struct AVPacket;
struct AVFrame;
struct SwrContext;

namespace folio::audio {

// AAC in MP4 containers (m4a, m4b) and anything else libavformat opens.
class FFmpegDecoder : public AudioDecoder {
public:
    FFmpegDecoder() = default;
    ~FFmpegDecoder() override;

    bool open(const std::string& filepath) override;
    void close() override;

    int read_pcm(float* buffer, int max_frames) override;
    bool seek(int64_t frame) override;

    int sample_rate() const override { return sample_rate_; }
    int channels() const override { return channels_; }
    int64_t total_frames() const override { return total_frames_; }
    int64_t position_frames() const override { return position_frames_; }
    bool is_open() const override { return format_ctx_ != nullptr; }

private:
    bool decode_next();

    AVFormatContext* format_ctx_ = nullptr;
    AVCodecContext* codec_ctx_ = nullptr;
    AVPacket* packet_ = nullptr;
    AVFrame* frame_ = nullptr;
    SwrContext* swr_ctx_ = nullptr;

    int audio_stream_index_ = -1;
    int sample_rate_ = 0;
    int channels_ = 0;
    int64_t total_frames_ = 0;
    int64_t position_frames_ = 0;

    // Converted frames not yet handed out
    std::vector<float> pending_;
    size_t pending_offset_ = 0;
};

}  // namespace folio::audio
