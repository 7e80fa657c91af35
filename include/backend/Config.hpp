#pragma once

#include <filesystem>
#include <string>
#include <unordered_map>

namespace folio::backend {

struct Config {
    // Playback settings
    int skip_forward_seconds = 30;
    int skip_backward_seconds = 30;
    double playback_rate = 1.0;
    int progress_save_interval_seconds = 30;
    double finish_tolerance_seconds = 5.0;
    double chapter_restart_threshold_seconds = 3.0;
    bool smart_rewind = true;
    int smart_rewind_max_seconds = 30;

    // Hold-to-seek settings
    double rewind_step_seconds = 2.0;
    double fast_forward_step_seconds = 5.0;
    int continuous_interval_ms = 100;

    // Sleep timer settings
    int sleep_default_minutes = 30;
    int sleep_extend_minutes = 15;
    double chapter_end_tolerance_seconds = 1.0;

    // Background sync settings
    int sync_interval_seconds = 10;
    int sync_max_retries = 3;
    int sync_retry_base_ms = 2000;

    // Keybinds: action -> key name
    std::unordered_map<std::string, std::string> keybinds;

    // Directory settings
    std::filesystem::path data_directory;

    // Logging
    std::string log_level = "info";
    std::string log_file = "/tmp/folio_debug.log";
};

class ConfigLoader {
public:
    // Loads the user config, writing a default file first if none exists.
    static Config load_config();
    static Config load_from_file(const std::filesystem::path& path);
    static bool save_config(const Config& cfg, const std::filesystem::path& path);

    static std::filesystem::path get_config_file();
    static Config create_default_config();
};

}  // namespace folio::backend
