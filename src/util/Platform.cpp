#include "util/Platform.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace folio::util {

std::filesystem::path Platform::get_config_directory() {
    if (auto xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "folio";
    }
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".config" / "folio";
    }
    Logger::warn("Platform: HOME env var not set, using fallback: .config/folio");
    return ".config/folio";
}

std::filesystem::path Platform::get_data_directory() {
    if (auto xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "folio";
    }
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".local" / "share" / "folio";
    }
    Logger::warn("Platform: HOME env var not set, using fallback: .local/share/folio");
    return ".local/share/folio";
}

bool Platform::is_audio_file(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const std::string extensions[] = {
        ".mp3", ".flac", ".ogg", ".oga", ".wav", ".m4a", ".m4b", ".aac"
    };

    for (const auto& e : extensions) {
        if (ext == e) return true;
    }
    return false;
}

std::string Platform::get_audio_format(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    if (!ext.empty() && ext[0] == '.') {
        ext = ext.substr(1);
    }
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

}  // namespace folio::util
