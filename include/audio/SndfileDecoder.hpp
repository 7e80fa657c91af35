#pragma once

#include "audio/AudioDecoder.hpp"
#include <sndfile.h>

namespace folio::audio {

// FLAC and WAV through libsndfile.
class SndfileDecoder : public AudioDecoder {
public:
    SndfileDecoder() = default;
    ~SndfileDecoder() override;

    bool open(const std::string& filepath) override;
    void close() override;

    int read_pcm(float* buffer, int max_frames) override;
    bool seek(int64_t frame) override;

    int sample_rate() const override { return info_.samplerate; }
    int channels() const override { return info_.channels; }
    int64_t total_frames() const override { return static_cast<int64_t>(info_.frames); }
    int64_t position_frames() const override { return position_frames_; }
    bool is_open() const override { return file_ != nullptr; }

private:
    SNDFILE* file_ = nullptr;
    SF_INFO info_{};
    int64_t position_frames_ = 0;
};

}  // namespace folio::audio
