#include "backend/SyncQueue.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <vector>

namespace folio::backend {

SyncQueue::Settings SyncQueue::Settings::from_config(const Config& cfg) {
    Settings s;
    s.interval = std::chrono::seconds(std::max(1, cfg.sync_interval_seconds));
    s.max_retries = std::clamp(cfg.sync_max_retries, 1, Settings::MAX_RETRIES);
    s.retry_base_ms = std::max(100, cfg.sync_retry_base_ms);
    return s;
}

SyncQueue::SyncQueue(ProgressGateway& gateway, RemoteProgressSink& sink,
                     events::Scheduler& scheduler, Settings settings)
    : gateway_(gateway), sink_(sink), scheduler_(scheduler), settings_(settings) {}

SyncQueue::~SyncQueue() {
    ticker_.cancel();
}

void SyncQueue::start() {
    if (ticker_.active()) return;
    util::Logger::info("SyncQueue: Started");
    ticker_ = scheduler_.schedule("progress-sync", settings_.interval, [this]() { process_queue(); });
}

void SyncQueue::stop() {
    ticker_.cancel();
}

void SyncQueue::enqueue(const std::string& item_id) {
    abandoned_.erase(item_id);
    queue_.try_emplace(item_id);
}

void SyncQueue::process_queue() {
    for (const auto& record : gateway_.get_unsynced()) {
        if (!abandoned_.count(record.item_id)) {
            queue_.try_emplace(record.item_id);
        }
    }

    auto now = scheduler_.clock().now_ms();
    std::vector<std::string> due;
    for (const auto& [id, entry] : queue_) {
        if (now >= entry.next_attempt_ms) {
            due.push_back(id);
        }
    }

    for (const auto& id : due) {
        if (push_one(id)) {
            queue_.erase(id);
            continue;
        }

        auto& entry = queue_[id];
        entry.attempts++;
        if (entry.attempts >= settings_.max_retries) {
            util::Logger::warn("SyncQueue: Giving up on " + id + " after " +
                               std::to_string(entry.attempts) + " attempts");
            abandoned_.insert(id);
            queue_.erase(id);
            continue;
        }
        int shift = std::min(entry.attempts - 1, Settings::MAX_BACKOFF_SHIFT);
        entry.next_attempt_ms = now + (settings_.retry_base_ms << shift);
        util::Logger::debug("SyncQueue: Retrying " + id + " in " +
                            std::to_string(entry.next_attempt_ms - now) + "ms");
    }
}

size_t SyncQueue::force_sync_all() {
    size_t synced = 0;
    for (const auto& record : gateway_.get_unsynced()) {
        if (push_one(record.item_id)) {
            queue_.erase(record.item_id);
            abandoned_.erase(record.item_id);
            ++synced;
        }
    }
    util::Logger::info("SyncQueue: Forced sync pushed " + std::to_string(synced) + " records");
    return synced;
}

bool SyncQueue::push_one(const std::string& item_id) {
    auto record = gateway_.get_local_record(item_id);
    if (!record || record->synced) {
        return true;
    }

    if (!sink_.push(*record)) {
        util::Logger::warn("SyncQueue: Remote rejected progress for " + item_id);
        return false;
    }
    if (!gateway_.mark_synced(item_id)) {
        util::Logger::warn("SyncQueue: Pushed " + item_id + " but could not mark it synced");
    }
    return true;
}

}  // namespace folio::backend
