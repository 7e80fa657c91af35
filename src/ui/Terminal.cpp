#include "ui/Terminal.hpp"
#include "util/Logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace folio::ui {

// Only a flag is touched in the handler
static volatile std::sig_atomic_t g_resize_pending = 0;

static void sigwinch_handler(int) {
    g_resize_pending = 1;
}

namespace {

ssize_t read_byte(char& c) {
    ssize_t n;
    do {
        n = read(STDIN_FILENO, &c, 1);
    } while (n < 0 && errno == EINTR);
    return n;
}

}  // namespace

Terminal& Terminal::instance() {
    static Terminal instance;
    return instance;
}

Terminal::~Terminal() {
    shutdown();
}

void Terminal::init() {
    if (initialized_) return;

#ifdef __linux__
    if (tcgetattr(STDIN_FILENO, &original_termios_) != 0) {
        util::Logger::warn(std::format("Terminal: tcgetattr failed ({})", strerror(errno)));
    }

    ::termios raw = original_termios_;
    raw.c_lflag &= ~(ECHO | ICANON);
    raw.c_iflag &= ~(IXON | ICRNL);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw);

    int flags = fcntl(STDIN_FILENO, F_GETFL, 0);
    fcntl(STDIN_FILENO, F_SETFL, flags | O_NONBLOCK);

    std::signal(SIGWINCH, sigwinch_handler);
#endif

    running_ = true;
    writer_thread_ = std::thread(&Terminal::writer_loop, this);

    write_raw("\033[?25l");  // Hide cursor
    initialized_ = true;
}

void Terminal::shutdown() {
    if (!initialized_) return;

    write_raw("\r\033[2K\033[?25h");  // Clear status line, show cursor

    running_ = false;
    queue_cv_.notify_all();
    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }

#ifdef __linux__
    int flags = fcntl(STDIN_FILENO, F_GETFL, 0);
    fcntl(STDIN_FILENO, F_SETFL, flags & ~O_NONBLOCK);
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &original_termios_);
#endif
    initialized_ = false;
}

bool Terminal::is_initialized() const {
    return initialized_;
}

void Terminal::writer_loop() {
    while (true) {
        std::string chunk;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !write_queue_.empty() || !running_; });
            if (write_queue_.empty()) {
                if (!running_) break;
                continue;
            }
            chunk = std::move(write_queue_.front());
            write_queue_.pop_front();
        }

        size_t written = 0;
        while (written < chunk.size()) {
            ssize_t n = write(STDOUT_FILENO, chunk.data() + written, chunk.size() - written);
            if (n > 0) {
                written += static_cast<size_t>(n);
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                // stdout shares the non-blocking flag with stdin on a tty
                struct pollfd pfd = {STDOUT_FILENO, POLLOUT, 0};
                poll(&pfd, 1, 100);
                continue;
            }
            util::Logger::error("Terminal: Writer error: " + std::string(strerror(errno)));
            break;
        }
    }
}

void Terminal::write_raw(const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        write_queue_.push_back(text);
    }
    queue_cv_.notify_one();
}

void Terminal::draw_status_line(const std::string& text) {
    write_raw(std::format("\r\033[2K{}", text));
}

InputEvent Terminal::read_escape_sequence() {
    char c = 0;
    if (read_byte(c) == 1 && c == '[' && read_byte(c) == 1) {
        switch (c) {
            case 'A': return {InputEvent::Type::KeyPress, 0, "up"};
            case 'B': return {InputEvent::Type::KeyPress, 0, "down"};
            case 'C': return {InputEvent::Type::KeyPress, 0, "right"};
            case 'D': return {InputEvent::Type::KeyPress, 0, "left"};
        }
    }
    return {InputEvent::Type::KeyPress, 27, "escape"};
}

InputEvent Terminal::read_input() {
    if (g_resize_pending) {
        g_resize_pending = 0;
        return {InputEvent::Type::Resize, 0, "resize"};
    }

    char c = 0;
    ssize_t n = read_byte(c);
    if (n != 1) {
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            util::Logger::debug(std::format("Terminal: read() failed, errno={}", errno));
        }
        return {};
    }

    if (c == '\033') return read_escape_sequence();
    if (c == '\n' || c == '\r') return {InputEvent::Type::KeyPress, c, "enter"};
    if (c == ' ') return {InputEvent::Type::KeyPress, c, "space"};
    if (c == 127 || c == '\b') return {InputEvent::Type::KeyPress, c, "backspace"};

    return {InputEvent::Type::KeyPress, c, std::string(1, c)};
}

int Terminal::get_terminal_width() const {
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) != 0 || w.ws_col == 0) {
        return 80;
    }
    return w.ws_col;
}

}  // namespace folio::ui
