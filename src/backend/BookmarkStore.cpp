#include "backend/BookmarkStore.hpp"
#include "backend/BinaryIO.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <openssl/sha.h>
#include <sstream>

namespace folio::backend {

BookmarkStore::BookmarkStore(std::filesystem::path directory, const util::Clock& clock)
    : directory_(std::move(directory)), clock_(clock) {}

std::string BookmarkStore::file_name_for(const std::string& book_id) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(book_id.data()), book_id.size(), hash);

    std::ostringstream hex;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return hex.str() + ".bin";
}

std::vector<model::Bookmark> BookmarkStore::load(const std::string& book_id) {
    return entries(book_id);
}

std::optional<model::Bookmark> BookmarkStore::add(const std::string& book_id, model::Bookmark bookmark) {
    if (book_id.empty()) {
        util::Logger::warn("BookmarkStore: Cannot bookmark without a book id");
        return std::nullopt;
    }

    auto& list = entries(book_id);

    bookmark.created_at = clock_.now_ms();
    std::string base_id = book_id + "_" + std::to_string(bookmark.created_at);
    std::string id = base_id;
    for (int suffix = 1; std::any_of(list.begin(), list.end(),
                                     [&](const model::Bookmark& b) { return b.id == id; });
         ++suffix) {
        id = base_id + "_" + std::to_string(suffix);
    }
    bookmark.id = id;

    auto pos = std::upper_bound(list.begin(), list.end(), bookmark.time,
                                [](double t, const model::Bookmark& b) { return t < b.time; });
    list.insert(pos, bookmark);

    if (!flush(book_id)) {
        util::Logger::warn("BookmarkStore: Bookmark " + id + " kept in memory only");
    }
    util::Logger::info("BookmarkStore: Added " + id);
    return bookmark;
}

bool BookmarkStore::update(const std::string& book_id, const std::string& bookmark_id,
                           const std::optional<std::string>& title, const std::optional<std::string>& note) {
    auto& list = entries(book_id);
    auto it = std::find_if(list.begin(), list.end(),
                           [&](const model::Bookmark& b) { return b.id == bookmark_id; });
    if (it == list.end()) {
        util::Logger::warn("BookmarkStore: No bookmark " + bookmark_id + " to update");
        return false;
    }

    if (title) it->title = *title;
    if (note) it->note = *note;
    return flush(book_id);
}

bool BookmarkStore::remove(const std::string& book_id, const std::string& bookmark_id) {
    auto& list = entries(book_id);
    auto removed = std::erase_if(list, [&](const model::Bookmark& b) { return b.id == bookmark_id; });
    if (removed == 0) {
        util::Logger::warn("BookmarkStore: No bookmark " + bookmark_id + " to remove");
        return false;
    }
    return flush(book_id);
}

std::vector<model::Bookmark>& BookmarkStore::entries(const std::string& book_id) {
    auto it = cache_.find(book_id);
    if (it != cache_.end()) {
        return it->second;
    }

    std::vector<model::Bookmark> list;
    auto path = directory_ / file_name_for(book_id);
    if (std::filesystem::exists(path) && !read_file(path, list)) {
        util::Logger::error("BookmarkStore: Could not read " + path.string() + ", starting with " +
                            std::to_string(list.size()) + " bookmarks");
    }
    std::sort(list.begin(), list.end(),
              [](const model::Bookmark& a, const model::Bookmark& b) { return a.time < b.time; });
    return cache_.emplace(book_id, std::move(list)).first->second;
}

bool BookmarkStore::read_file(const std::filesystem::path& path, std::vector<model::Bookmark>& out) const {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;

    uint64_t magic = 0;
    uint32_t version = 0;
    binary::read_pod(in, magic);
    binary::read_pod(in, version);
    if (magic != BOOKMARK_MAGIC || version != FORMAT_VERSION) {
        return false;
    }

    uint32_t count = 0;
    if (!binary::read_pod(in, count)) return false;

    for (uint32_t i = 0; i < count; ++i) {
        model::Bookmark b;
        bool ok = binary::read_string(in, b.id) &&
                  binary::read_string(in, b.title) &&
                  binary::read_string(in, b.note) &&
                  binary::read_pod(in, b.time) &&
                  binary::read_string(in, b.chapter_title) &&
                  binary::read_pod(in, b.created_at);
        if (!ok) return false;
        out.push_back(std::move(b));
    }
    return true;
}

bool BookmarkStore::flush(const std::string& book_id) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        util::Logger::error("BookmarkStore: Cannot create " + directory_.string() + ": " + ec.message());
        return false;
    }

    const auto& list = cache_[book_id];
    auto path = directory_ / file_name_for(book_id);
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            util::Logger::error("BookmarkStore: Cannot write " + tmp.string());
            return false;
        }

        binary::write_pod(out, BOOKMARK_MAGIC);
        binary::write_pod(out, FORMAT_VERSION);
        binary::write_pod(out, static_cast<uint32_t>(list.size()));
        for (const auto& b : list) {
            binary::write_string(out, b.id);
            binary::write_string(out, b.title);
            binary::write_string(out, b.note);
            binary::write_pod(out, b.time);
            binary::write_string(out, b.chapter_title);
            binary::write_pod(out, b.created_at);
        }
        if (!out) return false;
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        util::Logger::error("BookmarkStore: Cannot replace " + path.string() + ": " + ec.message());
        return false;
    }
    return true;
}

}  // namespace folio::backend
