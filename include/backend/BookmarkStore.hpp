#pragma once

#include "model/Records.hpp"
#include "util/Clock.hpp"
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace folio::backend {

// Bookmarks per book, one binary file per book named by the SHA-256 of the
// book id. Lists are kept sorted by time.
class BookmarkStore {
public:
    BookmarkStore(std::filesystem::path directory, const util::Clock& clock);

    [[nodiscard]] std::vector<model::Bookmark> load(const std::string& book_id);

    // Assigns id and created_at, then persists. Returns the stored bookmark.
    std::optional<model::Bookmark> add(const std::string& book_id, model::Bookmark bookmark);
    bool update(const std::string& book_id, const std::string& bookmark_id,
                const std::optional<std::string>& title, const std::optional<std::string>& note);
    bool remove(const std::string& book_id, const std::string& bookmark_id);

    [[nodiscard]] static std::string file_name_for(const std::string& book_id);

private:
    std::vector<model::Bookmark>& entries(const std::string& book_id);
    bool read_file(const std::filesystem::path& path, std::vector<model::Bookmark>& out) const;
    bool flush(const std::string& book_id);

    static constexpr uint64_t BOOKMARK_MAGIC = 0x464F4C494F424D31ULL;  // 'FOLIOBM1'
    static constexpr uint32_t FORMAT_VERSION = 1;

    std::filesystem::path directory_;
    const util::Clock& clock_;
    std::map<std::string, std::vector<model::Bookmark>> cache_;
};

}  // namespace folio::backend
