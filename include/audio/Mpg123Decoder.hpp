#pragma once

#include "audio/AudioDecoder.hpp"
#include <mpg123.h>

namespace folio::audio {

class Mpg123Decoder : public AudioDecoder {
public:
    Mpg123Decoder();
    ~Mpg123Decoder() override;

    bool open(const std::string& filepath) override;
    void close() override;

    int read_pcm(float* buffer, int max_frames) override;
    bool seek(int64_t frame) override;

    int sample_rate() const override { return sample_rate_; }
    int channels() const override { return channels_; }
    int64_t total_frames() const override { return total_frames_; }
    int64_t position_frames() const override { return position_frames_; }
    bool is_open() const override { return opened_; }

private:
    mpg123_handle* handle_ = nullptr;
    bool opened_ = false;
    int sample_rate_ = 0;
    int channels_ = 0;
    int64_t total_frames_ = 0;
    int64_t position_frames_ = 0;
};

}  // namespace folio::audio
