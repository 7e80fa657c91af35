#pragma once

#include <string>
#include <vector>

namespace folio::model {

// Times are seconds from the start of the book unless noted otherwise.
struct Chapter {
    int id = 0;
    double start = 0.0;
    double end = 0.0;
    std::string title;

    bool operator==(const Chapter&) const = default;
};

// One file of a multi-file book. start_offset is where the track begins on
// the book-wide timeline.
struct TrackInfo {
    std::string url;
    std::string title;
    double start_offset = 0.0;
    double duration = 0.0;

    bool operator==(const TrackInfo&) const = default;
};

struct BookMetadata {
    std::string title;
    std::string author;
    std::string narrator;
    std::string cover_path;

    bool operator==(const BookMetadata&) const = default;
};

// Everything needed to start a playback session. Either `url` (single
// stream) or `tracks` (multi-file) is set.
struct LoadRequest {
    std::string book_id;
    std::string url;
    std::vector<TrackInfo> tracks;
    std::vector<Chapter> chapters;
    BookMetadata metadata;
    double duration = 0.0;
    bool is_offline = true;
};

}  // namespace folio::model
