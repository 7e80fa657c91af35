#pragma once

#include "model/Book.hpp"
#include <optional>
#include <vector>

namespace folio::core {

// Pure lookups over a chapter list sorted by start with contiguous,
// non-overlapping ranges.
class ChapterLocator {
public:
    static constexpr double RESTART_THRESHOLD_SECONDS = 3.0;

    // Index of the chapter containing `position`: the last chapter whose
    // start is <= position. Positions before the first chapter map to 0 and
    // positions past the end map to the last chapter. Returns 0 for an
    // empty list; callers check emptiness first.
    [[nodiscard]] static int locate(const std::vector<model::Chapter>& chapters, double position);

    [[nodiscard]] static std::optional<int> next_index(const std::vector<model::Chapter>& chapters, double position);

    // More than `threshold` seconds into a chapter restarts it, otherwise
    // steps back one chapter (never below 0).
    [[nodiscard]] static int previous_index(const std::vector<model::Chapter>& chapters, double position,
                                            double threshold = RESTART_THRESHOLD_SECONDS);

    [[nodiscard]] static const model::Chapter* chapter_at(const std::vector<model::Chapter>& chapters, int index);

    // Percentage (0-100) of the current chapter already played.
    [[nodiscard]] static double progress_in_chapter(const std::vector<model::Chapter>& chapters, double position);
    [[nodiscard]] static double time_remaining_in_chapter(const std::vector<model::Chapter>& chapters, double position);
};

}  // namespace folio::core
