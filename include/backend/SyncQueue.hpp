#pragma once

#include "backend/Config.hpp"
#include "backend/ProgressStore.hpp"
#include "events/Scheduler.hpp"
#include "model/Records.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <set>
#include <string>

namespace folio::backend {

// Where synced progress goes. The wire protocol lives behind this.
class RemoteProgressSink {
public:
    virtual ~RemoteProgressSink() = default;
    virtual bool push(const model::ProgressRecord& record) = 0;
};

// Pushes unsynced local progress to a remote sink in the background.
// Failed items back off exponentially and are dropped from the queue after
// max_retries; they stay unsynced locally and come back on the next enqueue.
class SyncQueue {
public:
    struct Settings {
        static constexpr int MAX_RETRIES = 20;
        // Backoff stops doubling after this many failures
        static constexpr int MAX_BACKOFF_SHIFT = 16;

        std::chrono::milliseconds interval{10000};
        int max_retries = 3;
        int64_t retry_base_ms = 2000;

        static Settings from_config(const Config& cfg);
    };

    SyncQueue(ProgressGateway& gateway, RemoteProgressSink& sink,
              events::Scheduler& scheduler, Settings settings);
    ~SyncQueue();

    SyncQueue(const SyncQueue&) = delete;
    SyncQueue& operator=(const SyncQueue&) = delete;

    void start();
    void stop();

    void enqueue(const std::string& item_id);

    // One pass over the queue: picks up unsynced records and pushes every
    // item whose backoff has elapsed.
    void process_queue();

    // Pushes every unsynced record now, ignoring backoff. Returns how many
    // were synced.
    size_t force_sync_all();

    [[nodiscard]] size_t pending() const { return queue_.size(); }
    [[nodiscard]] bool is_abandoned(const std::string& item_id) const { return abandoned_.count(item_id) > 0; }

private:
    struct Entry {
        int attempts = 0;
        int64_t next_attempt_ms = 0;
    };

    bool push_one(const std::string& item_id);

    ProgressGateway& gateway_;
    RemoteProgressSink& sink_;
    events::Scheduler& scheduler_;
    Settings settings_;

    std::map<std::string, Entry> queue_;
    std::set<std::string> abandoned_;
    events::TaskHandle ticker_;
};

}  // namespace folio::backend
