#include "backend/BookLoader.hpp"
#include "backend/BookmarkStore.hpp"
#include "backend/Config.hpp"
#include "backend/ProgressStore.hpp"
#include "backend/SnapshotPublisher.hpp"
#include "core/PlaybackCoordinator.hpp"
#include "core/PlaybackError.hpp"
#include "engine/LocalAudioEngine.hpp"
#include "events/EventBus.hpp"
#include "events/Scheduler.hpp"
#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include "util/Clock.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include "util/TimeFormat.hpp"
#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

using namespace std::chrono_literals;
using namespace folio;

static std::atomic<bool> g_shutdown{false};

// Only sets the flag; the main loop unloads so the final save still happens
static void signal_handler(int) {
    g_shutdown.store(true);
}

namespace {

constexpr double SCRUB_STEP_SECONDS = 10.0;

struct Options {
    std::optional<std::filesystem::path> config_file;
    std::optional<double> start_position;
    std::filesystem::path book_path;
};

void print_usage() {
    std::cerr << "Usage: folio [--config FILE] [--start SECONDS] PATH\n"
              << "  PATH is an audio file or a directory of audio files\n";
}

std::optional<Options> parse_args(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            opts.config_file = argv[++i];
        } else if (arg == "--start" && i + 1 < argc) {
            std::string value = argv[++i];
            double seconds = 0.0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), seconds);
            if (ec != std::errc() || ptr != value.data() + value.size() || seconds < 0.0) {
                std::cerr << "folio: invalid --start value '" << value << "'\n";
                return std::nullopt;
            }
            opts.start_position = seconds;
        } else if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "folio: unknown option " << arg << "\n";
            return std::nullopt;
        } else if (opts.book_path.empty()) {
            opts.book_path = arg;
        } else {
            std::cerr << "folio: more than one PATH given\n";
            return std::nullopt;
        }
    }
    if (opts.book_path.empty()) return std::nullopt;
    return opts;
}

std::string sleep_label(const model::Snapshot& snap) {
    switch (snap.sleep_timer_kind) {
        case model::SleepTimerKind::Countdown:
            return " zz " + util::format_duration(snap.sleep_timer_remaining);
        case model::SleepTimerKind::EndOfChapter:
            return " zz end of chapter";
        case model::SleepTimerKind::Off:
            break;
    }
    return "";
}

std::string render_status(const model::Snapshot& snap, int width) {
    std::string state = snap.is_loading ? "…" : snap.is_seeking ? "»" : snap.is_playing ? "▶" : "‖";
    if (snap.is_buffering) state = "~";

    std::string left = state + " " + snap.title;
    if (snap.chapter_count > 0) {
        left += std::format(" | {}/{} {}", snap.current_chapter_index + 1, snap.chapter_count,
                            snap.current_chapter_title);
    }
    if (!snap.last_error.empty()) {
        left += " | " + snap.last_error;
    }

    double fraction = snap.duration > 0.0 ? snap.position / snap.duration : 0.0;
    std::string right = std::format("{} / {} {} {:.2f}x{}", util::format_duration(snap.position),
                                    util::format_duration(snap.duration), ui::progress_bar(fraction, 22),
                                    snap.playback_rate, sleep_label(snap));
    return ui::lr_align(width, left, right);
}

// Maps a key to its configured action, then to a coordinator intent.
class KeyDispatcher {
public:
    KeyDispatcher(core::PlaybackCoordinator& coordinator, const backend::Config& config)
        : coordinator_(coordinator), config_(config) {
        for (const auto& [action, key] : config.keybinds) {
            actions_[key] = action;
        }
    }

    void handle(const ui::InputEvent& event) {
        if (event.type != ui::InputEvent::Type::KeyPress) return;

        std::string action;
        if (auto it = actions_.find(event.key_name); it != actions_.end()) {
            action = it->second;
        } else if (event.key_name == "enter") {
            action = "commit_seek";
        } else if (event.key_name == "escape") {
            action = "cancel_seek";
        } else {
            return;
        }

        try {
            dispatch(action);
        } catch (const core::PlaybackError& e) {
            util::Logger::warn("Input: '" + action + "' rejected: " + e.what());
        }
    }

private:
    void toggle_continuous(model::SeekDirection direction) {
        const auto& seek = coordinator_.seek_state();
        bool same = seek.mode == model::SeekMode::Continuous && seek.direction == direction;
        if (same) {
            coordinator_.stop_continuous_seeking();
        } else {
            coordinator_.start_continuous_seeking(direction);
        }
    }

    void scrub(model::SeekDirection direction) {
        if (!coordinator_.seek_state().is_seeking) {
            coordinator_.start_seeking(direction);
        }
        double step = direction == model::SeekDirection::Forward ? SCRUB_STEP_SECONDS : -SCRUB_STEP_SECONDS;
        coordinator_.update_seek_position(coordinator_.seek_state().seek_position + step);
    }

    void dispatch(const std::string& action) {
        // Any key other than a hold key releases an active hold
        bool hold_key = action == "hold_rewind" || action == "hold_fast_forward";
        if (!hold_key && coordinator_.seek_state().mode == model::SeekMode::Continuous) {
            coordinator_.stop_continuous_seeking();
            if (action != "quit") return;
        }

        if (action == "play_pause") {
            coordinator_.toggle_play_pause();
        } else if (action == "skip_backward") {
            coordinator_.skip_backward();
        } else if (action == "skip_forward") {
            coordinator_.skip_forward();
        } else if (action == "hold_rewind") {
            toggle_continuous(model::SeekDirection::Backward);
        } else if (action == "hold_fast_forward") {
            toggle_continuous(model::SeekDirection::Forward);
        } else if (action == "scrub_backward") {
            scrub(model::SeekDirection::Backward);
        } else if (action == "scrub_forward") {
            scrub(model::SeekDirection::Forward);
        } else if (action == "commit_seek") {
            coordinator_.commit_seek();
        } else if (action == "cancel_seek") {
            coordinator_.cancel_seek();
        } else if (action == "prev_chapter") {
            coordinator_.prev_chapter();
        } else if (action == "next_chapter") {
            coordinator_.next_chapter();
        } else if (action == "rate_up") {
            coordinator_.set_playback_rate(coordinator_.transport().playback_rate + 0.25);
        } else if (action == "rate_down") {
            coordinator_.set_playback_rate(coordinator_.transport().playback_rate - 0.25);
        } else if (action == "sleep_timer") {
            if (coordinator_.sleep_timer_state().kind == model::SleepTimerKind::Off) {
                coordinator_.set_sleep_timer(config_.sleep_default_minutes);
            } else {
                coordinator_.clear_sleep_timer();
            }
        } else if (action == "sleep_end_of_chapter") {
            coordinator_.set_sleep_timer_end_of_chapter();
        } else if (action == "sleep_extend") {
            coordinator_.extend_sleep_timer();
        } else if (action == "bookmark") {
            if (auto bookmark = coordinator_.add_bookmark()) {
                util::Logger::info("Input: Bookmark added at " + util::format_duration(bookmark->time));
            }
        } else if (action == "quit") {
            g_shutdown.store(true);
        } else {
            util::Logger::debug("Input: Unknown action '" + action + "'");
        }
    }

    core::PlaybackCoordinator& coordinator_;
    const backend::Config& config_;
    std::unordered_map<std::string, std::string> actions_;
};

}  // namespace

int main(int argc, char** argv) {
    auto options = parse_args(argc, argv);
    if (!options) {
        print_usage();
        return 2;
    }

    try {
        auto config = options->config_file ? backend::ConfigLoader::load_from_file(*options->config_file)
                                           : backend::ConfigLoader::load_config();

        util::Logger::init(config.log_file);
        util::Logger::set_level(util::Logger::parse_level(config.log_level));
        util::Logger::info("FOLIO starting...");

        std::filesystem::path data_dir =
            config.data_directory.empty() ? util::Platform::get_data_directory() : config.data_directory;
        std::filesystem::create_directories(data_dir);

        auto request = backend::BookLoader::load(options->book_path);
        if (!request) {
            std::cerr << "folio: cannot load " << options->book_path.string() << "\n";
            return 1;
        }

        util::SystemClock clock;
        events::Scheduler scheduler(clock);
        events::EventBus bus;
        backend::SnapshotPublisher publisher;

        backend::FileProgressStore progress(data_dir / "progress.bin", clock);
        if (!progress.load()) {
            util::Logger::warn("Progress file unreadable, starting with an empty store");
        }
        backend::BookmarkStore bookmarks(data_dir / "bookmarks", clock);

        engine::LocalAudioEngine engine(scheduler);
        core::PlaybackCoordinator coordinator(engine, progress, bookmarks, scheduler, bus, publisher,
                                              core::PlaybackSettings::from_config(config));

        bus.subscribe(events::Event::Type::BookFinished, [](const events::Event& e) {
            util::Logger::info("Finished " + e.book_id);
        });
        bus.subscribe(events::Event::Type::SleepTimerExpired, [](const events::Event& e) {
            util::Logger::info("Sleep timer paused playback at " + util::format_duration(e.position));
        });

        std::string load_error;
        coordinator.load_book(*request, options->start_position, std::nullopt, true,
                              [&load_error](std::exception_ptr error) {
                                  if (!error) return;
                                  try {
                                      std::rethrow_exception(error);
                                  } catch (const std::exception& e) {
                                      load_error = e.what();
                                  }
                                  g_shutdown.store(true);
                              });

        auto& terminal = ui::Terminal::instance();
        terminal.init();
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        KeyDispatcher keys(coordinator, config);
        uint64_t drawn_seq = 0;
        bool redraw = true;

        while (!g_shutdown.load()) {
            for (auto event = terminal.read_input(); event.type != ui::InputEvent::Type::None;
                 event = terminal.read_input()) {
                if (event.type == ui::InputEvent::Type::Resize) {
                    redraw = true;
                    continue;
                }
                keys.handle(event);
            }

            scheduler.process();

            uint64_t seq = publisher.seq();
            if (redraw || seq != drawn_seq) {
                if (auto snap = publisher.get_current()) {
                    terminal.draw_status_line(render_status(*snap, terminal.get_terminal_width()));
                }
                drawn_seq = seq;
                redraw = false;
            }

            std::this_thread::sleep_for(20ms);
        }

        coordinator.unload();
        terminal.shutdown();
        util::Logger::info("FOLIO exiting");

        if (!load_error.empty()) {
            std::cerr << "folio: " << load_error << "\n";
            return 1;
        }
        return 0;
    } catch (const std::exception& e) {
        ui::Terminal::instance().shutdown();
        util::Logger::error(std::string("Fatal: ") + e.what());
        std::cerr << "folio: " << e.what() << "\n";
        return 1;
    }
}
