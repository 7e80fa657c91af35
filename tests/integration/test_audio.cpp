#include "../framework/SimpleTest.hpp"
#include "../framework/TestSupport.hpp"
#include "audio/AudioDecoder.hpp"
#include "audio/FFmpegDecoder.hpp"
#include "audio/Mpg123Decoder.hpp"
#include "audio/SndfileDecoder.hpp"
#include "audio/VorbisDecoder.hpp"
#include "backend/BookLoader.hpp"
#include <cmath>
#include <fstream>
#include <numbers>
#include <sndfile.h>
#include <vector>

using namespace folio;

namespace {

constexpr int RATE = 8000;

// Mono 16-bit WAV holding a 440Hz tone.
bool write_tone(const std::filesystem::path& path, double seconds, int channels = 1) {
    SF_INFO info{};
    info.samplerate = RATE;
    info.channels = channels;
    info.format = SF_FORMAT_WAV | SF_FORMAT_PCM_16;

    SNDFILE* file = sf_open(path.c_str(), SFM_WRITE, &info);
    if (!file) return false;

    auto frames = static_cast<sf_count_t>(seconds * RATE);
    std::vector<float> samples(static_cast<size_t>(frames) * channels);
    for (sf_count_t i = 0; i < frames; ++i) {
        float v = 0.25f * static_cast<float>(std::sin(2.0 * std::numbers::pi * 440.0 * i / RATE));
        for (int c = 0; c < channels; ++c) {
            samples[static_cast<size_t>(i) * channels + c] = v;
        }
    }
    bool ok = sf_writef_float(file, samples.data(), frames) == frames;
    sf_close(file);
    return ok;
}

int drain(audio::AudioDecoder& decoder) {
    std::vector<float> buffer(1024 * static_cast<size_t>(decoder.channels()));
    int total = 0;
    while (int n = decoder.read_pcm(buffer.data(), 1024)) {
        total += n;
    }
    return total;
}

}  // namespace

TEST_CASE(test_sndfile_decodes_wav) {
    test::TempDir dir("audio");
    auto path = dir.path() / "tone.wav";
    ASSERT_TRUE(write_tone(path, 3.0, 2));

    audio::SndfileDecoder decoder;
    ASSERT_TRUE(decoder.open(path.string()));
    ASSERT_TRUE(decoder.is_open());
    ASSERT_EQ(decoder.sample_rate(), RATE);
    ASSERT_EQ(decoder.channels(), 2);
    ASSERT_EQ(decoder.total_frames(), int64_t{3 * RATE});
    ASSERT_NEAR(decoder.duration_seconds(), 3.0, 1e-9);

    std::vector<float> buffer(512 * 2);
    ASSERT_EQ(decoder.read_pcm(buffer.data(), 512), 512);
    ASSERT_EQ(decoder.position_frames(), int64_t{512});
    bool audible = false;
    for (float s : buffer) {
        if (std::abs(s) > 0.1f) audible = true;
    }
    ASSERT_TRUE(audible);

    ASSERT_EQ(drain(decoder), 3 * RATE - 512);
    ASSERT_EQ(decoder.read_pcm(buffer.data(), 512), 0);
}

TEST_CASE(test_sndfile_seek) {
    test::TempDir dir("audio");
    auto path = dir.path() / "tone.wav";
    ASSERT_TRUE(write_tone(path, 3.0));

    audio::SndfileDecoder decoder;
    ASSERT_TRUE(decoder.open(path.string()));
    ASSERT_TRUE(decoder.seek_to_seconds(2.0));
    ASSERT_NEAR(decoder.position_seconds(), 2.0, 1e-9);
    ASSERT_EQ(drain(decoder), RATE);

    // Past the end clamps to the last frame
    ASSERT_TRUE(decoder.seek_to_seconds(10.0));
    ASSERT_EQ(decoder.position_frames(), int64_t{3 * RATE});

    decoder.close();
    ASSERT_FALSE(decoder.is_open());
    ASSERT_FALSE(decoder.seek(0));
}

TEST_CASE(test_sndfile_rejects_missing_file) {
    audio::SndfileDecoder decoder;
    ASSERT_FALSE(decoder.open("/nonexistent/folio/tone.wav"));
    ASSERT_FALSE(decoder.is_open());
}

TEST_CASE(test_decoder_factory_by_extension) {
    auto mp3 = audio::create_decoder("book/01.MP3");
    auto flac = audio::create_decoder("book/01.flac");
    auto wav = audio::create_decoder("book/01.wav");
    auto ogg = audio::create_decoder("book/01.ogg");
    auto m4b = audio::create_decoder("book.m4b");

    ASSERT_TRUE(dynamic_cast<audio::Mpg123Decoder*>(mp3.get()) != nullptr);
    ASSERT_TRUE(dynamic_cast<audio::SndfileDecoder*>(flac.get()) != nullptr);
    ASSERT_TRUE(dynamic_cast<audio::SndfileDecoder*>(wav.get()) != nullptr);
    ASSERT_TRUE(dynamic_cast<audio::VorbisDecoder*>(ogg.get()) != nullptr);
    ASSERT_TRUE(dynamic_cast<audio::FFmpegDecoder*>(m4b.get()) != nullptr);
    ASSERT_TRUE(audio::create_decoder("cover.png") == nullptr);
}

TEST_CASE(test_ffmpeg_decodes_wav) {
    test::TempDir dir("audio");
    auto path = dir.path() / "tone.wav";
    ASSERT_TRUE(write_tone(path, 2.0));

    audio::FFmpegDecoder decoder;
    ASSERT_TRUE(decoder.open(path.string()));
    ASSERT_EQ(decoder.sample_rate(), RATE);
    ASSERT_EQ(decoder.channels(), 1);

    int frames = drain(decoder);
    ASSERT_TRUE(std::abs(frames - 2 * RATE) <= RATE / 100);
}

TEST_CASE(test_book_loader_single_file) {
    test::TempDir dir("loader");
    auto path = dir.path() / "Short Story.wav";
    ASSERT_TRUE(write_tone(path, 3.0));

    auto request = backend::BookLoader::load(path);
    ASSERT_TRUE(request.has_value());
    ASSERT_EQ(request->book_id, std::filesystem::canonical(path).string());
    ASSERT_EQ(request->url, request->book_id);
    ASSERT_TRUE(request->tracks.empty());
    ASSERT_NEAR(request->duration, 3.0, 0.05);
    ASSERT_EQ(request->metadata.title, std::string("Short Story"));

    // No chapter table: the whole file is one chapter
    ASSERT_EQ(request->chapters.size(), 1u);
    ASSERT_NEAR(request->chapters[0].start, 0.0, 1e-9);
    ASSERT_NEAR(request->chapters[0].end, request->duration, 1e-9);
}

TEST_CASE(test_book_loader_directory) {
    test::TempDir dir("loader");
    ASSERT_TRUE(write_tone(dir.path() / "02 Second.wav", 2.0));
    ASSERT_TRUE(write_tone(dir.path() / "01 First.wav", 3.0));
    std::ofstream(dir.path() / "notes.txt") << "not audio";

    auto request = backend::BookLoader::load(dir.path());
    ASSERT_TRUE(request.has_value());
    ASSERT_TRUE(request->url.empty());
    ASSERT_EQ(request->tracks.size(), 2u);
    ASSERT_EQ(request->tracks[0].title, std::string("01 First"));
    ASSERT_NEAR(request->tracks[0].start_offset, 0.0, 1e-9);
    ASSERT_NEAR(request->tracks[1].start_offset, request->tracks[0].duration, 1e-9);
    ASSERT_NEAR(request->duration, 5.0, 0.1);

    ASSERT_EQ(request->chapters.size(), 2u);
    ASSERT_EQ(request->chapters[1].title, std::string("02 Second"));
    ASSERT_NEAR(request->chapters[1].start, request->tracks[1].start_offset, 1e-9);
    ASSERT_NEAR(request->chapters[1].end, request->duration, 1e-9);
}

TEST_CASE(test_book_loader_rejects_bad_paths) {
    test::TempDir dir("loader");
    std::ofstream(dir.path() / "readme.txt") << "text";

    ASSERT_FALSE(backend::BookLoader::load(dir.path() / "missing.m4b").has_value());
    ASSERT_FALSE(backend::BookLoader::load(dir.path() / "readme.txt").has_value());
    // A directory with no audio in it
    ASSERT_FALSE(backend::BookLoader::load(dir.path()).has_value());
}

int main() {
    return folio::test::TestRunner::instance().run_all();
}
