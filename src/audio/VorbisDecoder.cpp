#include "audio/VorbisDecoder.hpp"
#include "util/Logger.hpp"

namespace folio::audio {

VorbisDecoder::~VorbisDecoder() {
    close();
}

bool VorbisDecoder::open(const std::string& filepath) {
    close();

    int ret = ov_fopen(filepath.c_str(), &vf_);
    if (ret < 0) {
        util::Logger::error("VorbisDecoder: Failed to open " + filepath + " (code=" + std::to_string(ret) + ")");
        return false;
    }

    vorbis_info* info = ov_info(&vf_, -1);
    if (!info) {
        util::Logger::error("VorbisDecoder: No stream info in " + filepath);
        ov_clear(&vf_);
        return false;
    }

    sample_rate_ = static_cast<int>(info->rate);
    channels_ = info->channels;
    ogg_int64_t total = ov_pcm_total(&vf_, -1);
    total_frames_ = total < 0 ? 0 : static_cast<int64_t>(total);
    position_frames_ = 0;
    is_open_ = true;

    util::Logger::debug("VorbisDecoder: Opened " + filepath + " (" + std::to_string(sample_rate_) + "Hz, " +
                        std::to_string(channels_) + "ch, " + std::to_string(total_frames_) + " frames)");
    return true;
}

void VorbisDecoder::close() {
    if (is_open_) {
        ov_clear(&vf_);
        is_open_ = false;
    }
    sample_rate_ = 0;
    channels_ = 0;
    total_frames_ = 0;
    position_frames_ = 0;
}

int VorbisDecoder::read_pcm(float* buffer, int max_frames) {
    if (!is_open_ || !buffer || max_frames <= 0) return 0;

    float** pcm = nullptr;
    int section = 0;
    int frames_read = 0;

    while (frames_read < max_frames) {
        long ret = ov_read_float(&vf_, &pcm, max_frames - frames_read, &section);
        if (ret == OV_HOLE) continue;  // Recoverable gap in the stream
        if (ret <= 0) break;

        for (long i = 0; i < ret; ++i) {
            for (int ch = 0; ch < channels_; ++ch) {
                buffer[(frames_read + i) * channels_ + ch] = pcm[ch][i];
            }
        }
        frames_read += static_cast<int>(ret);
    }

    position_frames_ += frames_read;
    return frames_read;
}

bool VorbisDecoder::seek(int64_t frame) {
    if (!is_open_) return false;

    int result = ov_pcm_seek(&vf_, static_cast<ogg_int64_t>(frame));
    if (result != 0) {
        util::Logger::error("VorbisDecoder: Seek failed (code=" + std::to_string(result) + ")");
        return false;
    }
    position_frames_ = frame;
    return true;
}

}  // namespace folio::audio
