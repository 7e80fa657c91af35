#include "audio/AudioDecoder.hpp"
#include "audio/FFmpegDecoder.hpp"
#include "audio/Mpg123Decoder.hpp"
#include "audio/SndfileDecoder.hpp"
#include "audio/VorbisDecoder.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"

namespace folio::audio {

std::unique_ptr<AudioDecoder> create_decoder(const std::filesystem::path& path) {
    auto format = util::Platform::get_audio_format(path);

    if (format == "mp3") return std::make_unique<Mpg123Decoder>();
    if (format == "flac" || format == "wav") return std::make_unique<SndfileDecoder>();
    if (format == "ogg" || format == "oga") return std::make_unique<VorbisDecoder>();
    if (format == "m4a" || format == "m4b" || format == "aac") return std::make_unique<FFmpegDecoder>();

    util::Logger::warn("DecoderFactory: Unsupported format '" + format + "' for " + path.string());
    return nullptr;
}

}  // namespace folio::audio
