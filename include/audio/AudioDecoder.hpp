#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace folio::audio {

// Pull decoder producing interleaved 32-bit float frames.
class AudioDecoder {
public:
    virtual ~AudioDecoder() = default;

    [[nodiscard]] virtual bool open(const std::string& filepath) = 0;
    virtual void close() = 0;

    // Returns frames written to `buffer`; 0 at end of stream or on error.
    [[nodiscard]] virtual int read_pcm(float* buffer, int max_frames) = 0;
    [[nodiscard]] virtual bool seek(int64_t frame) = 0;

    [[nodiscard]] virtual int sample_rate() const = 0;
    [[nodiscard]] virtual int channels() const = 0;
    [[nodiscard]] virtual int64_t total_frames() const = 0;
    [[nodiscard]] virtual int64_t position_frames() const = 0;
    [[nodiscard]] virtual bool is_open() const = 0;

    bool seek_to_seconds(double seconds) {
        if (sample_rate() <= 0) return false;
        if (seconds < 0.0) seconds = 0.0;
        auto frame = static_cast<int64_t>(seconds * sample_rate());
        if (total_frames() > 0 && frame > total_frames()) frame = total_frames();
        return seek(frame);
    }

    [[nodiscard]] double position_seconds() const {
        if (sample_rate() <= 0) return 0.0;
        return static_cast<double>(position_frames()) / sample_rate();
    }

    [[nodiscard]] double duration_seconds() const {
        if (sample_rate() <= 0) return 0.0;
        return static_cast<double>(total_frames()) / sample_rate();
    }
};

// Picks a decoder by file extension. Returns nullptr for unsupported formats.
std::unique_ptr<AudioDecoder> create_decoder(const std::filesystem::path& path);

}  // namespace folio::audio
