#pragma once

#include <filesystem>
#include <string>

namespace folio::util {

class Platform {
public:
    static std::filesystem::path get_config_directory();
    static std::filesystem::path get_data_directory();

    static bool is_audio_file(const std::filesystem::path& path);
    static std::string get_audio_format(const std::filesystem::path& path);
};

}  // namespace folio::util
