#pragma once

struct pw_thread_loop;

namespace folio::audio {

// Owns the PipeWire thread loop shared by every output stream of one engine.
class PipeWireContext {
public:
    PipeWireContext() = default;
    ~PipeWireContext();

    PipeWireContext(const PipeWireContext&) = delete;
    PipeWireContext& operator=(const PipeWireContext&) = delete;

    [[nodiscard]] bool init();
    struct pw_thread_loop* get_loop() const { return loop_; }

private:
    struct pw_thread_loop* loop_ = nullptr;
};

}  // namespace folio::audio
