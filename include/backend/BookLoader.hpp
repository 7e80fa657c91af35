#pragma once

#include "model/Book.hpp"
#include <filesystem>
#include <optional>
#include <vector>

namespace folio::backend {

// Turns a file or directory on disk into a LoadRequest. A directory is one
// track per audio file in name order; a single file may carry its own
// chapter table (m4b).
class BookLoader {
public:
    static std::optional<model::LoadRequest> load(const std::filesystem::path& path);

private:
    struct Probe {
        double duration = 0.0;
        std::string title;
        std::string artist;
        std::string narrator;
        std::vector<model::Chapter> chapters;
    };

    static std::optional<Probe> probe(const std::filesystem::path& file);
    static std::vector<std::filesystem::path> collect_tracks(const std::filesystem::path& dir);
    static std::string stem_title(const std::filesystem::path& file);
};

}  // namespace folio::backend
