#include "audio/PipeWireOutput.hpp"
#include "util/Logger.hpp"
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <string>
#include <thread>

namespace folio::audio {

namespace {

void on_process(void* userdata) {
    // Buffers are dequeued from the writer thread
    (void)userdata;
}

const struct pw_stream_events stream_events = {
    .version = PW_VERSION_STREAM_EVENTS,
    .destroy = nullptr,
    .state_changed = nullptr,
    .control_info = nullptr,
    .io_changed = nullptr,
    .param_changed = nullptr,
    .add_buffer = nullptr,
    .remove_buffer = nullptr,
    .process = on_process,
    .drained = nullptr,
    .command = nullptr,
    .trigger_done = nullptr,
};

const char* state_name(enum pw_stream_state state) {
    switch (state) {
        case PW_STREAM_STATE_ERROR: return "ERROR";
        case PW_STREAM_STATE_UNCONNECTED: return "UNCONNECTED";
        case PW_STREAM_STATE_CONNECTING: return "CONNECTING";
        case PW_STREAM_STATE_PAUSED: return "PAUSED";
        case PW_STREAM_STATE_STREAMING: return "STREAMING";
    }
    return "UNKNOWN";
}

}  // namespace

PipeWireOutput::~PipeWireOutput() {
    close();
}

bool PipeWireOutput::init(PipeWireContext& context, int sample_rate, int channels) {
    util::Logger::debug("PipeWireOutput: Initializing (" + std::to_string(sample_rate) + "Hz, " +
                        std::to_string(channels) + "ch)");

    if (stream_) {
        util::Logger::debug("PipeWireOutput: Already initialized, skipping");
        return false;
    }

    struct pw_thread_loop* loop = context.get_loop();
    if (!loop) {
        util::Logger::error("PipeWireOutput: Context loop is null");
        return false;
    }

    context_ = &context;
    sample_rate_ = sample_rate;
    channels_ = channels;
    paused_ = false;

    // All PipeWire calls happen under the thread loop lock
    pw_thread_loop_lock(loop);

    struct pw_properties* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Playback",
        PW_KEY_MEDIA_ROLE, "Production",
        nullptr
    );

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop),
        "Folio Audiobook Player",
        props,
        &stream_events,
        this
    );

    if (!stream_) {
        util::Logger::error("PipeWireOutput: Failed to create stream");
        pw_thread_loop_unlock(loop);
        return false;
    }

    uint8_t buffer[1024];
    struct spa_pod_builder builder = SPA_POD_BUILDER_INIT(buffer, sizeof(buffer));

    struct spa_audio_info_raw info = {};
    info.format = SPA_AUDIO_FORMAT_F32;
    info.channels = static_cast<uint32_t>(channels_);
    info.rate = static_cast<uint32_t>(sample_rate_);

    const struct spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&builder, SPA_PARAM_EnumFormat, &info);

    int result = pw_stream_connect(
        stream_,
        PW_DIRECTION_OUTPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS),
        params, 1
    );

    pw_thread_loop_unlock(loop);

    if (result < 0) {
        util::Logger::error("PipeWireOutput: Stream connect failed (result=" + std::to_string(result) + ")");
        close();
        return false;
    }

    util::Logger::info("PipeWireOutput: Initialized successfully");
    return true;
}

void PipeWireOutput::close() {
    if (stream_ && context_ && context_->get_loop()) {
        util::Logger::debug("PipeWireOutput: Closing output");
        struct pw_thread_loop* loop = context_->get_loop();

        pw_thread_loop_lock(loop);
        pw_stream_flush(stream_, true);  // Drain before destroy
        pw_stream_destroy(stream_);
        pw_thread_loop_unlock(loop);
    } else if (stream_) {
        pw_stream_destroy(stream_);
    }

    stream_ = nullptr;
    sample_rate_ = 0;
    channels_ = 0;
}

void PipeWireOutput::flush() {
    if (!stream_ || !context_ || !context_->get_loop()) return;

    struct pw_thread_loop* loop = context_->get_loop();
    pw_thread_loop_lock(loop);
    pw_stream_flush(stream_, false);
    pw_thread_loop_unlock(loop);
}

bool PipeWireOutput::wait_for_streaming(const std::stop_token& stop) {
    struct pw_thread_loop* loop = context_->get_loop();

    // Suspended sinks can take a while to wake up
    constexpr int max_attempts = 100;
    enum pw_stream_state state = PW_STREAM_STATE_UNCONNECTED;
    for (int i = 0; i < max_attempts; ++i) {
        if (stop.stop_requested()) return false;

        pw_thread_loop_lock(loop);
        state = pw_stream_get_state(stream_, nullptr);
        pw_thread_loop_unlock(loop);

        if (state == PW_STREAM_STATE_STREAMING) return true;
        if (state == PW_STREAM_STATE_ERROR) {
            util::Logger::error("PipeWireOutput: Stream in ERROR state");
            return false;
        }

        if (i % 10 == 0 && i > 0) {
            util::Logger::debug(std::string("PipeWireOutput: Waiting for STREAMING state (current=") +
                                state_name(state) + ", attempt=" + std::to_string(i) + ")");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    util::Logger::error(std::string("PipeWireOutput: Stream never reached STREAMING (stuck in state=") +
                        state_name(state) + ")");
    return false;
}

// Returns with the loop locked when a buffer was acquired.
struct pw_buffer* PipeWireOutput::acquire_buffer(const std::stop_token& stop) {
    struct pw_thread_loop* loop = context_->get_loop();

    constexpr int max_retries = 50;
    for (int i = 0; i < max_retries; ++i) {
        if (stop.stop_requested()) return nullptr;

        pw_thread_loop_lock(loop);
        if (struct pw_buffer* buf = pw_stream_dequeue_buffer(stream_)) {
            return buf;
        }
        pw_thread_loop_unlock(loop);

        // 2ms, 4ms, 8ms, 16ms, 32ms, capped at 50ms
        int delay_ms = std::min(2 << std::min(i, 4), 50);
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
    }

    util::Logger::error("PipeWireOutput: Failed to acquire buffer after " + std::to_string(max_retries) +
                        " retries - sink may be suspended");
    return nullptr;
}

size_t PipeWireOutput::write(const float* data, size_t frames, std::stop_token stop) {
    if (!stream_ || !context_ || !context_->get_loop() || !data || frames == 0) {
        return 0;
    }

    if (++write_calls_ % 100 == 0) {
        util::Logger::debug("PipeWireOutput: Writing " + std::to_string(frames) + " frames");
    }

    if (!wait_for_streaming(stop)) return 0;

    struct pw_buffer* pw_buf = acquire_buffer(stop);
    if (!pw_buf) return 0;

    struct pw_thread_loop* loop = context_->get_loop();
    struct spa_buffer* buf = pw_buf->buffer;
    if (!buf->datas[0].data) {
        pw_stream_queue_buffer(stream_, pw_buf);
        pw_thread_loop_unlock(loop);
        return 0;
    }

    size_t bytes_per_frame = channels_ * sizeof(float);
    size_t frames_to_write = std::min(frames, static_cast<size_t>(buf->datas[0].maxsize / bytes_per_frame));
    size_t total_samples = frames_to_write * channels_;

    // Clamp and replace NaN/Inf with silence
    float* dst = static_cast<float*>(buf->datas[0].data);
    for (size_t i = 0; i < total_samples; ++i) {
        float val = data[i];
        if (!std::isfinite(val)) {
            if (bad_samples_ % 100 == 0) {
                util::Logger::warn("PipeWireOutput: NaN/Inf sample replaced (count=" +
                                   std::to_string(bad_samples_) + ")");
            }
            ++bad_samples_;
            val = 0.0f;
        }
        dst[i] = std::clamp(val, -1.0f, 1.0f);
    }

    buf->datas[0].chunk->offset = 0;
    buf->datas[0].chunk->stride = static_cast<int32_t>(bytes_per_frame);
    buf->datas[0].chunk->size = static_cast<uint32_t>(total_samples * sizeof(float));

    pw_stream_queue_buffer(stream_, pw_buf);
    pw_thread_loop_unlock(loop);

    return frames_to_write;
}

void PipeWireOutput::pause(bool paused) {
    if (paused_ == paused) return;
    if (!stream_ || !context_ || !context_->get_loop()) return;

    util::Logger::debug(std::string("PipeWireOutput: ") + (paused ? "Paused" : "Resumed"));

    struct pw_thread_loop* loop = context_->get_loop();
    pw_thread_loop_lock(loop);
    pw_stream_set_active(stream_, !paused);
    pw_thread_loop_unlock(loop);

    paused_ = paused;
}

}  // namespace folio::audio
