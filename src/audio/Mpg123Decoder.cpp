#include "audio/Mpg123Decoder.hpp"
#include "util/Logger.hpp"
#include <mutex>

namespace folio::audio {

namespace {

// mpg123_init is process-wide and must run before the first handle
void ensure_mpg123_initialized() {
    static std::once_flag once;
    std::call_once(once, []() { mpg123_init(); });
}

}  // namespace

Mpg123Decoder::Mpg123Decoder() {
    ensure_mpg123_initialized();
    int err = MPG123_OK;
    handle_ = mpg123_new(nullptr, &err);
    if (!handle_) {
        util::Logger::error("Mpg123Decoder: mpg123_new failed (" + std::string(mpg123_plain_strerror(err)) + ")");
    }
}

Mpg123Decoder::~Mpg123Decoder() {
    close();
    if (handle_) {
        mpg123_delete(handle_);
        handle_ = nullptr;
    }
}

bool Mpg123Decoder::open(const std::string& filepath) {
    if (!handle_) {
        util::Logger::error("Mpg123Decoder: No handle");
        return false;
    }
    close();

    // Float output straight from the decoder; accurate seeks need the
    // full frame index.
    mpg123_param(handle_, MPG123_FLAGS, MPG123_FORCE_FLOAT | MPG123_GAPLESS, 0.0);
    mpg123_param(handle_, MPG123_ADD_FLAGS, MPG123_SEEKBUFFER, 0.0);

    if (mpg123_open(handle_, filepath.c_str()) != MPG123_OK) {
        util::Logger::error("Mpg123Decoder: Failed to open " + filepath + " (" +
                            std::string(mpg123_strerror(handle_)) + ")");
        return false;
    }

    long rate = 0;
    int channels = 0;
    int encoding = 0;
    if (mpg123_getformat(handle_, &rate, &channels, &encoding) != MPG123_OK) {
        util::Logger::error("Mpg123Decoder: No format for " + filepath);
        mpg123_close(handle_);
        return false;
    }

    mpg123_format_none(handle_);
    if (mpg123_format(handle_, rate, channels, MPG123_ENC_FLOAT_32) != MPG123_OK) {
        util::Logger::error("Mpg123Decoder: Float output not supported for " + filepath);
        mpg123_close(handle_);
        return false;
    }

    // Full scan so the length and seeks are exact for VBR files
    mpg123_scan(handle_);
    off_t length = mpg123_length(handle_);

    sample_rate_ = static_cast<int>(rate);
    channels_ = channels;
    total_frames_ = length == MPG123_ERR ? 0 : static_cast<int64_t>(length);
    position_frames_ = 0;
    opened_ = true;

    util::Logger::debug("Mpg123Decoder: Opened " + filepath + " (" + std::to_string(sample_rate_) + "Hz, " +
                        std::to_string(channels_) + "ch, " + std::to_string(total_frames_) + " frames)");
    return true;
}

void Mpg123Decoder::close() {
    if (opened_ && handle_) {
        mpg123_close(handle_);
    }
    opened_ = false;
    sample_rate_ = 0;
    channels_ = 0;
    total_frames_ = 0;
    position_frames_ = 0;
}

int Mpg123Decoder::read_pcm(float* buffer, int max_frames) {
    if (!opened_ || !buffer || max_frames <= 0) return 0;

    size_t bytes_wanted = static_cast<size_t>(max_frames) * channels_ * sizeof(float);
    size_t bytes_read = 0;
    int result = mpg123_read(handle_, reinterpret_cast<unsigned char*>(buffer), bytes_wanted, &bytes_read);

    if (result == MPG123_NEW_FORMAT) {
        long rate = 0;
        int channels = 0;
        int encoding = 0;
        mpg123_getformat(handle_, &rate, &channels, &encoding);
        if (rate != sample_rate_ || channels != channels_) {
            util::Logger::warn("Mpg123Decoder: Format changed mid-stream, stopping track");
            return 0;
        }
        result = mpg123_read(handle_, reinterpret_cast<unsigned char*>(buffer), bytes_wanted, &bytes_read);
    }

    if (result == MPG123_ERR) {
        util::Logger::error("Mpg123Decoder: Read error (" + std::string(mpg123_strerror(handle_)) + ")");
        return 0;
    }

    int frames = static_cast<int>(bytes_read / (sizeof(float) * channels_));
    position_frames_ += frames;
    return frames;
}

bool Mpg123Decoder::seek(int64_t frame) {
    if (!opened_) return false;

    off_t result = mpg123_seek(handle_, static_cast<off_t>(frame), SEEK_SET);
    if (result < 0) {
        util::Logger::error("Mpg123Decoder: Seek failed to frame " + std::to_string(frame));
        return false;
    }
    position_frames_ = static_cast<int64_t>(result);
    return true;
}

}  // namespace folio::audio
