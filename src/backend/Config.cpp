#include "backend/Config.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <string>

namespace folio::backend {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

template <typename T>
void parse_number(const std::string& key, const std::string& value, T& out) {
    T parsed{};
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        util::Logger::warn("Config: Ignoring malformed value for '" + key + "': " + value);
        return;
    }
    out = parsed;
}

void parse_bool(const std::string& key, const std::string& value, bool& out) {
    if (value == "true") out = true;
    else if (value == "false") out = false;
    else util::Logger::warn("Config: Ignoring malformed boolean for '" + key + "': " + value);
}

std::filesystem::path expand_home(const std::string& value) {
    if (!value.empty() && value[0] == '~') {
        if (auto home = std::getenv("HOME")) {
            return std::filesystem::path(home) / value.substr(value.size() > 1 ? 2 : 1);
        }
    }
    return value;
}

std::string keybind_or(const Config& cfg, const std::string& action, const std::string& fallback) {
    auto it = cfg.keybinds.find(action);
    return it != cfg.keybinds.end() ? it->second : fallback;
}

}  // namespace

Config ConfigLoader::load_config() {
    util::Logger::info("Config: Loading configuration");

    auto config_file = get_config_file();
    if (std::filesystem::exists(config_file)) {
        return load_from_file(config_file);
    }

    Config cfg = create_default_config();
    if (!save_config(cfg, config_file)) {
        util::Logger::warn("Config: Could not write default config to " + config_file.string());
    }
    return cfg;
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    util::Logger::debug("Config: Loading from " + path.string());

    Config cfg = create_default_config();

    std::ifstream file(path);
    if (!file) {
        util::Logger::warn("Config: Cannot open " + path.string() + ", using defaults");
        return cfg;
    }

    std::string line, current_section;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        if (line[0] == '[' && line.back() == ']') {
            current_section = line.substr(1, line.length() - 2);
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        if (current_section == "playback") {
            if (key == "skip_forward_seconds") parse_number(key, value, cfg.skip_forward_seconds);
            else if (key == "skip_backward_seconds") parse_number(key, value, cfg.skip_backward_seconds);
            else if (key == "playback_rate") parse_number(key, value, cfg.playback_rate);
            else if (key == "progress_save_interval_seconds") parse_number(key, value, cfg.progress_save_interval_seconds);
            else if (key == "finish_tolerance_seconds") parse_number(key, value, cfg.finish_tolerance_seconds);
            else if (key == "chapter_restart_threshold_seconds") parse_number(key, value, cfg.chapter_restart_threshold_seconds);
            else if (key == "smart_rewind") parse_bool(key, value, cfg.smart_rewind);
            else if (key == "smart_rewind_max_seconds") parse_number(key, value, cfg.smart_rewind_max_seconds);
        }
        else if (current_section == "seeking") {
            if (key == "rewind_step_seconds") parse_number(key, value, cfg.rewind_step_seconds);
            else if (key == "fast_forward_step_seconds") parse_number(key, value, cfg.fast_forward_step_seconds);
            else if (key == "continuous_interval_ms") parse_number(key, value, cfg.continuous_interval_ms);
        }
        else if (current_section == "sleep") {
            if (key == "default_minutes") parse_number(key, value, cfg.sleep_default_minutes);
            else if (key == "extend_minutes") parse_number(key, value, cfg.sleep_extend_minutes);
            else if (key == "chapter_end_tolerance_seconds") parse_number(key, value, cfg.chapter_end_tolerance_seconds);
        }
        else if (current_section == "sync") {
            if (key == "interval_seconds") parse_number(key, value, cfg.sync_interval_seconds);
            else if (key == "max_retries") parse_number(key, value, cfg.sync_max_retries);
            else if (key == "retry_base_ms") parse_number(key, value, cfg.sync_retry_base_ms);
        }
        else if (current_section == "keybinds") {
            cfg.keybinds[key] = value;
        }
        else if (current_section == "paths") {
            if (key == "data_directory") cfg.data_directory = expand_home(value);
        }
        else if (current_section == "log") {
            if (key == "level") cfg.log_level = value;
            else if (key == "file") cfg.log_file = value;
        }
    }

    return cfg;
}

bool ConfigLoader::save_config(const Config& cfg, const std::filesystem::path& path) {
    util::Logger::info("Config: Saving configuration to " + path.string());

    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        util::Logger::error("Config: Cannot create " + path.parent_path().string() + ": " + ec.message());
        return false;
    }

    std::ofstream file(path);
    if (!file) return false;

    file << "# FOLIO Config\n";
    file << "# Generated on first run; edit with care\n\n";

    file << "[playback]\n";
    file << "# Seconds jumped by the skip keys\n";
    file << "skip_forward_seconds = " << cfg.skip_forward_seconds << "\n";
    file << "skip_backward_seconds = " << cfg.skip_backward_seconds << "\n\n";
    file << "# Initial speed (0.5 - 3.0)\n";
    file << "playback_rate = " << cfg.playback_rate << "\n\n";
    file << "# How often progress is written while playing\n";
    file << "progress_save_interval_seconds = " << cfg.progress_save_interval_seconds << "\n\n";
    file << "# A finish report counts only this close to the end\n";
    file << "finish_tolerance_seconds = " << cfg.finish_tolerance_seconds << "\n\n";
    file << "# Previous-chapter restarts the current chapter past this point\n";
    file << "chapter_restart_threshold_seconds = " << cfg.chapter_restart_threshold_seconds << "\n\n";
    file << "# Rewind a little on resume, more after longer pauses\n";
    file << "smart_rewind = " << (cfg.smart_rewind ? "true" : "false") << "\n";
    file << "smart_rewind_max_seconds = " << cfg.smart_rewind_max_seconds << "\n\n";

    file << "[seeking]\n";
    file << "# Hold-to-seek step sizes and tick interval\n";
    file << "rewind_step_seconds = " << cfg.rewind_step_seconds << "\n";
    file << "fast_forward_step_seconds = " << cfg.fast_forward_step_seconds << "\n";
    file << "continuous_interval_ms = " << cfg.continuous_interval_ms << "\n\n";

    file << "[sleep]\n";
    file << "default_minutes = " << cfg.sleep_default_minutes << "\n";
    file << "extend_minutes = " << cfg.sleep_extend_minutes << "\n";
    file << "chapter_end_tolerance_seconds = " << cfg.chapter_end_tolerance_seconds << "\n\n";

    file << "[sync]\n";
    file << "interval_seconds = " << cfg.sync_interval_seconds << "\n";
    file << "max_retries = " << cfg.sync_max_retries << "\n";
    file << "retry_base_ms = " << cfg.sync_retry_base_ms << "\n\n";

    file << "[keybinds]\n";
    file << "play_pause = \"" << keybind_or(cfg, "play_pause", "space") << "\"\n";
    file << "skip_backward = \"" << keybind_or(cfg, "skip_backward", "left") << "\"\n";
    file << "skip_forward = \"" << keybind_or(cfg, "skip_forward", "right") << "\"\n";
    file << "hold_rewind = \"" << keybind_or(cfg, "hold_rewind", "[") << "\"\n";
    file << "hold_fast_forward = \"" << keybind_or(cfg, "hold_fast_forward", "]") << "\"\n";
    file << "scrub_backward = \"" << keybind_or(cfg, "scrub_backward", ",") << "\"\n";
    file << "scrub_forward = \"" << keybind_or(cfg, "scrub_forward", ".") << "\"\n";
    file << "prev_chapter = \"" << keybind_or(cfg, "prev_chapter", "p") << "\"\n";
    file << "next_chapter = \"" << keybind_or(cfg, "next_chapter", "n") << "\"\n";
    file << "rate_up = \"" << keybind_or(cfg, "rate_up", "+") << "\"\n";
    file << "rate_down = \"" << keybind_or(cfg, "rate_down", "-") << "\"\n";
    file << "sleep_timer = \"" << keybind_or(cfg, "sleep_timer", "s") << "\"\n";
    file << "sleep_end_of_chapter = \"" << keybind_or(cfg, "sleep_end_of_chapter", "e") << "\"\n";
    file << "sleep_extend = \"" << keybind_or(cfg, "sleep_extend", "x") << "\"\n";
    file << "bookmark = \"" << keybind_or(cfg, "bookmark", "b") << "\"\n";
    file << "quit = \"" << keybind_or(cfg, "quit", "q") << "\"\n\n";

    file << "[paths]\n";
    file << "# Progress and bookmarks live here\n";
    file << "data_directory = \"" << cfg.data_directory.string() << "\"\n\n";

    file << "[log]\n";
    file << "# debug, info, warn, error\n";
    file << "level = \"" << cfg.log_level << "\"\n";
    file << "file = \"" << cfg.log_file << "\"\n";

    return static_cast<bool>(file);
}

std::filesystem::path ConfigLoader::get_config_file() {
    return util::Platform::get_config_directory() / "config.toml";
}

Config ConfigLoader::create_default_config() {
    Config cfg;
    cfg.data_directory = util::Platform::get_data_directory();
    cfg.keybinds["play_pause"] = "space";
    cfg.keybinds["skip_backward"] = "left";
    cfg.keybinds["skip_forward"] = "right";
    cfg.keybinds["hold_rewind"] = "[";
    cfg.keybinds["hold_fast_forward"] = "]";
    cfg.keybinds["scrub_backward"] = ",";
    cfg.keybinds["scrub_forward"] = ".";
    cfg.keybinds["prev_chapter"] = "p";
    cfg.keybinds["next_chapter"] = "n";
    cfg.keybinds["rate_up"] = "+";
    cfg.keybinds["rate_down"] = "-";
    cfg.keybinds["sleep_timer"] = "s";
    cfg.keybinds["sleep_end_of_chapter"] = "e";
    cfg.keybinds["sleep_extend"] = "x";
    cfg.keybinds["bookmark"] = "b";
    cfg.keybinds["quit"] = "q";
    return cfg;
}

}  // namespace folio::backend
