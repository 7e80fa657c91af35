#include "backend/ProgressStore.hpp"
#include "backend/BinaryIO.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>

namespace folio::backend {

FileProgressStore::FileProgressStore(std::filesystem::path file, const util::Clock& clock)
    : file_(std::move(file)), clock_(clock) {}

bool FileProgressStore::load() {
    records_.clear();

    if (!std::filesystem::exists(file_)) {
        util::Logger::info("ProgressStore: No progress file at " + file_.string() + ", starting empty");
        return true;
    }

    std::ifstream in(file_, std::ios::binary);
    if (!in) {
        util::Logger::error("ProgressStore: Cannot open " + file_.string());
        return false;
    }

    uint64_t magic = 0;
    uint32_t version = 0;
    binary::read_pod(in, magic);
    binary::read_pod(in, version);
    if (magic != PROGRESS_MAGIC || version != FORMAT_VERSION) {
        util::Logger::error("ProgressStore: Unrecognized progress file format, ignoring " + file_.string());
        return false;
    }

    uint32_t count = 0;
    if (!binary::read_pod(in, count)) {
        util::Logger::error("ProgressStore: Truncated progress file");
        return false;
    }

    for (uint32_t i = 0; i < count; ++i) {
        model::ProgressRecord record;
        uint8_t finished = 0;
        uint8_t synced = 0;
        bool ok = binary::read_string(in, record.item_id) &&
                  binary::read_pod(in, record.current_time) &&
                  binary::read_pod(in, record.duration) &&
                  binary::read_pod(in, finished) &&
                  binary::read_pod(in, record.updated_at) &&
                  binary::read_pod(in, synced);
        if (!ok) {
            util::Logger::error("ProgressStore: Truncated record " + std::to_string(i) + ", keeping " +
                                std::to_string(records_.size()) + " records");
            return false;
        }
        record.is_finished = finished != 0;
        record.synced = synced != 0;
        records_[record.item_id] = std::move(record);
    }

    util::Logger::info("ProgressStore: Loaded " + std::to_string(records_.size()) + " progress records");
    return true;
}

bool FileProgressStore::save_local(const std::string& item_id, double position, double duration, bool is_finished) {
    if (item_id.empty() || !std::isfinite(position)) {
        util::Logger::warn("ProgressStore: Refusing to save invalid progress for '" + item_id + "'");
        return false;
    }

    auto& record = records_[item_id];
    record.item_id = item_id;
    record.current_time = std::max(0.0, position);
    record.duration = duration;
    record.is_finished = is_finished;
    record.updated_at = clock_.now_ms();
    record.synced = false;

    return flush();
}

std::optional<double> FileProgressStore::get_local(const std::string& item_id) {
    auto it = records_.find(item_id);
    if (it == records_.end()) return std::nullopt;
    return it->second.current_time;
}

std::optional<model::ProgressRecord> FileProgressStore::get_local_record(const std::string& item_id) {
    auto it = records_.find(item_id);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

bool FileProgressStore::mark_synced(const std::string& item_id) {
    auto it = records_.find(item_id);
    if (it == records_.end()) {
        util::Logger::warn("ProgressStore: mark_synced for unknown item '" + item_id + "'");
        return false;
    }
    it->second.synced = true;
    return flush();
}

std::vector<model::ProgressRecord> FileProgressStore::get_unsynced() {
    std::vector<model::ProgressRecord> result;
    for (const auto& [id, record] : records_) {
        if (!record.synced) {
            result.push_back(record);
        }
    }
    return result;
}

bool FileProgressStore::flush() {
    std::error_code ec;
    std::filesystem::create_directories(file_.parent_path(), ec);
    if (ec) {
        util::Logger::error("ProgressStore: Cannot create " + file_.parent_path().string() + ": " + ec.message());
        return false;
    }

    // Write a sibling file and rename it over the old one
    auto tmp = file_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            util::Logger::error("ProgressStore: Cannot write " + tmp.string());
            return false;
        }

        binary::write_pod(out, PROGRESS_MAGIC);
        binary::write_pod(out, FORMAT_VERSION);
        binary::write_pod(out, static_cast<uint32_t>(records_.size()));

        for (const auto& [id, record] : records_) {
            binary::write_string(out, record.item_id);
            binary::write_pod(out, record.current_time);
            binary::write_pod(out, record.duration);
            binary::write_pod(out, static_cast<uint8_t>(record.is_finished ? 1 : 0));
            binary::write_pod(out, record.updated_at);
            binary::write_pod(out, static_cast<uint8_t>(record.synced ? 1 : 0));
        }

        if (!out) {
            util::Logger::error("ProgressStore: Write failed for " + tmp.string());
            return false;
        }
    }

    std::filesystem::rename(tmp, file_, ec);
    if (ec) {
        util::Logger::error("ProgressStore: Cannot replace " + file_.string() + ": " + ec.message());
        return false;
    }
    return true;
}

}  // namespace folio::backend
