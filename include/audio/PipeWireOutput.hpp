#pragma once

#include "audio/PipeWireContext.hpp"
#include <cstddef>
#include <cstdint>
#include <stop_token>

struct pw_buffer;
struct pw_stream;

namespace folio::audio {

// Blocking float32 sink on top of a pw_stream.
class PipeWireOutput {
public:
    PipeWireOutput() = default;
    ~PipeWireOutput();

    PipeWireOutput(const PipeWireOutput&) = delete;
    PipeWireOutput& operator=(const PipeWireOutput&) = delete;

    bool init(PipeWireContext& context, int sample_rate, int channels);
    void close();

    // Returns number of frames actually written. Gives up early, returning
    // 0, once `stop` is requested.
    size_t write(const float* data, size_t frames, std::stop_token stop = {});
    void pause(bool paused);

    // Drops queued audio without playing it out (used after seeks)
    void flush();

    bool is_initialized() const { return stream_ != nullptr; }
    int get_sample_rate() const { return sample_rate_; }
    int get_channels() const { return channels_; }

private:
    bool wait_for_streaming(const std::stop_token& stop);
    struct pw_buffer* acquire_buffer(const std::stop_token& stop);

    int sample_rate_ = 0;
    int channels_ = 0;
    bool paused_ = false;
    uint64_t write_calls_ = 0;
    uint64_t bad_samples_ = 0;

    struct pw_stream* stream_ = nullptr;
    PipeWireContext* context_ = nullptr;  // Non-owning
};

}  // namespace folio::audio
