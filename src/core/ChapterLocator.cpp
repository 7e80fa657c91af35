#include "core/ChapterLocator.hpp"
#include <algorithm>

namespace folio::core {

int ChapterLocator::locate(const std::vector<model::Chapter>& chapters, double position) {
    // Backward scan: the first chapter found starting at or before the
    // position wins, which also resolves boundary ties to the later chapter.
    for (int i = static_cast<int>(chapters.size()) - 1; i >= 0; --i) {
        if (chapters[i].start <= position) {
            return i;
        }
    }
    return 0;
}

std::optional<int> ChapterLocator::next_index(const std::vector<model::Chapter>& chapters, double position) {
    if (chapters.empty()) return std::nullopt;
    int current = locate(chapters, position);
    if (current + 1 >= static_cast<int>(chapters.size())) {
        return std::nullopt;
    }
    return current + 1;
}

int ChapterLocator::previous_index(const std::vector<model::Chapter>& chapters, double position, double threshold) {
    if (chapters.empty()) return 0;
    int current = locate(chapters, position);
    if (position - chapters[current].start > threshold) {
        return current;
    }
    return std::max(0, current - 1);
}

const model::Chapter* ChapterLocator::chapter_at(const std::vector<model::Chapter>& chapters, int index) {
    if (index < 0 || index >= static_cast<int>(chapters.size())) {
        return nullptr;
    }
    return &chapters[index];
}

double ChapterLocator::progress_in_chapter(const std::vector<model::Chapter>& chapters, double position) {
    if (chapters.empty()) return 0.0;
    const auto& chapter = chapters[locate(chapters, position)];
    double length = chapter.end - chapter.start;
    if (length <= 0.0) return 0.0;
    return std::clamp((position - chapter.start) / length * 100.0, 0.0, 100.0);
}

double ChapterLocator::time_remaining_in_chapter(const std::vector<model::Chapter>& chapters, double position) {
    if (chapters.empty()) return 0.0;
    const auto& chapter = chapters[locate(chapters, position)];
    return std::max(0.0, chapter.end - position);
}

}  // namespace folio::core
