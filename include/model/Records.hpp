#pragma once

#include <cstdint>
#include <string>

namespace folio::model {

struct ProgressRecord {
    std::string item_id;
    double current_time = 0.0;
    double duration = 0.0;
    bool is_finished = false;
    int64_t updated_at = 0;  // epoch ms
    bool synced = false;

    bool operator==(const ProgressRecord&) const = default;
};

struct Bookmark {
    std::string id;
    std::string title;
    std::string note;
    double time = 0.0;
    std::string chapter_title;
    int64_t created_at = 0;  // epoch ms

    bool operator==(const Bookmark&) const = default;
};

}  // namespace folio::model
