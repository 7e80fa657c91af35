#pragma once

#include "audio/AudioDecoder.hpp"
#include <vorbis/vorbisfile.h>

namespace folio::audio {

class VorbisDecoder : public AudioDecoder {
public:
    VorbisDecoder() = default;
    ~VorbisDecoder() override;

    bool open(const std::string& filepath) override;
    void close() override;

    int read_pcm(float* buffer, int max_frames) override;
    bool seek(int64_t frame) override;

    int sample_rate() const override { return sample_rate_; }
    int channels() const override { return channels_; }
    int64_t total_frames() const override { return total_frames_; }
    int64_t position_frames() const override { return position_frames_; }
    bool is_open() const override { return is_open_; }

private:
    OggVorbis_File vf_{};
    bool is_open_ = false;
    int sample_rate_ = 0;
    int channels_ = 0;
    int64_t total_frames_ = 0;
    int64_t position_frames_ = 0;
};

}  // namespace folio::audio
