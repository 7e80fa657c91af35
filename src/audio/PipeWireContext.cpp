#include "audio/PipeWireContext.hpp"
#include "util/Logger.hpp"
#include <pipewire/pipewire.h>

namespace folio::audio {

PipeWireContext::~PipeWireContext() {
    if (loop_) {
        pw_thread_loop_stop(loop_);
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
    // pw_deinit() is left to process exit
}

bool PipeWireContext::init() {
    if (loop_) return true;

    pw_init(nullptr, nullptr);
    loop_ = pw_thread_loop_new("folio-audio", nullptr);
    if (!loop_) {
        util::Logger::error("PipeWireContext: Failed to create thread loop");
        return false;
    }

    if (pw_thread_loop_start(loop_) < 0) {
        util::Logger::error("PipeWireContext: Failed to start thread loop");
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
        return false;
    }

    util::Logger::debug("PipeWireContext: Thread loop running");
    return true;
}

}  // namespace folio::audio
