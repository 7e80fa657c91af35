#pragma once

#include "ui/InputEvent.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

#ifdef __linux__
#include <termios.h>
#endif

namespace folio::ui {

// Raw-mode terminal with non-blocking key input and an async writer.
class Terminal {
public:
    static Terminal& instance();

    void init();
    void shutdown();
    bool is_initialized() const;

    // Replaces the current line in place
    void draw_status_line(const std::string& text);
    void write_raw(const std::string& text);

    InputEvent read_input();
    int get_terminal_width() const;

private:
    Terminal() = default;
    ~Terminal();

    void writer_loop();
    static InputEvent read_escape_sequence();

    bool initialized_ = false;

    std::thread writer_thread_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::string> write_queue_;
    std::atomic<bool> running_{false};

#ifdef __linux__
    ::termios original_termios_{};
#endif
};

}  // namespace folio::ui
