#include "audio/SndfileDecoder.hpp"
#include "util/Logger.hpp"

namespace folio::audio {

SndfileDecoder::~SndfileDecoder() {
    close();
}

bool SndfileDecoder::open(const std::string& filepath) {
    close();

    info_ = SF_INFO{};
    file_ = sf_open(filepath.c_str(), SFM_READ, &info_);
    if (!file_) {
        util::Logger::error("SndfileDecoder: Failed to open " + filepath + " (" + sf_strerror(nullptr) + ")");
        info_ = SF_INFO{};
        return false;
    }

    position_frames_ = 0;
    util::Logger::debug("SndfileDecoder: Opened " + filepath + " (" + std::to_string(info_.samplerate) + "Hz, " +
                        std::to_string(info_.channels) + "ch, " + std::to_string(info_.frames) + " frames)");
    return true;
}

void SndfileDecoder::close() {
    if (file_) {
        sf_close(file_);
        file_ = nullptr;
    }
    info_ = SF_INFO{};
    position_frames_ = 0;
}

int SndfileDecoder::read_pcm(float* buffer, int max_frames) {
    if (!file_ || !buffer || max_frames <= 0) return 0;

    sf_count_t frames = sf_readf_float(file_, buffer, max_frames);
    if (frames < 0) {
        util::Logger::error(std::string("SndfileDecoder: Read error (") + sf_strerror(file_) + ")");
        return 0;
    }
    position_frames_ += frames;
    return static_cast<int>(frames);
}

bool SndfileDecoder::seek(int64_t frame) {
    if (!file_) return false;

    sf_count_t result = sf_seek(file_, static_cast<sf_count_t>(frame), SEEK_SET);
    if (result < 0) {
        util::Logger::error("SndfileDecoder: Seek failed to frame " + std::to_string(frame));
        return false;
    }
    position_frames_ = static_cast<int64_t>(result);
    return true;
}

}  // namespace folio::audio
