#pragma once

#include "backend/ProgressStore.hpp"
#include "model/Book.hpp"
#include <atomic>
#include <filesystem>
#include <map>
#include <string>
#include <unistd.h>

namespace folio::test {

// Fresh directory under /tmp, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("folio_" + tag + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// ProgressGateway kept in a map, with a switch to make writes fail.
class MemoryProgressGateway : public backend::ProgressGateway {
public:
    bool save_local(const std::string& item_id, double position, double duration, bool is_finished) override {
        ++save_calls;
        if (fail_saves) return false;
        auto& record = records[item_id];
        record.item_id = item_id;
        record.current_time = position;
        record.duration = duration;
        record.is_finished = is_finished;
        record.updated_at = ++stamp;
        record.synced = false;
        return true;
    }

    std::optional<double> get_local(const std::string& item_id) override {
        auto it = records.find(item_id);
        if (it == records.end()) return std::nullopt;
        return it->second.current_time;
    }

    std::optional<model::ProgressRecord> get_local_record(const std::string& item_id) override {
        auto it = records.find(item_id);
        if (it == records.end()) return std::nullopt;
        return it->second;
    }

    bool mark_synced(const std::string& item_id) override {
        auto it = records.find(item_id);
        if (it == records.end()) return false;
        it->second.synced = true;
        return true;
    }

    std::vector<model::ProgressRecord> get_unsynced() override {
        std::vector<model::ProgressRecord> out;
        for (const auto& [id, record] : records) {
            if (!record.synced) out.push_back(record);
        }
        return out;
    }

    std::map<std::string, model::ProgressRecord> records;
    bool fail_saves = false;
    int save_calls = 0;
    int64_t stamp = 0;
};

// Three 30-minute chapters, 5400s in total.
inline std::vector<model::Chapter> three_chapters() {
    return {
        {0, 0.0, 1800.0, "Opening"},
        {1, 1800.0, 3600.0, "Middle"},
        {2, 3600.0, 5400.0, "Ending"},
    };
}

}  // namespace folio::test
