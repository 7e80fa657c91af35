#pragma once

#include "util/Clock.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace folio::events {

// Cancellation token for a scheduled task. Copies share the same task.
// A default-constructed handle refers to nothing and cancel() on it is a no-op.
class TaskHandle {
public:
    TaskHandle() = default;

    void cancel();
    [[nodiscard]] bool active() const;

private:
    friend class Scheduler;
    explicit TaskHandle(std::shared_ptr<bool> alive) : alive_(std::move(alive)) {}

    std::shared_ptr<bool> alive_;
};

// Single-threaded cooperative event loop. Repeating tasks and posted
// one-shot tasks run from process() on the thread that owns the loop.
// post() is the only member that may be called from other threads.
class Scheduler {
public:
    using Task = std::function<void()>;

    explicit Scheduler(const util::Clock& clock);

    TaskHandle schedule(const std::string& name, std::chrono::milliseconds interval, Task task);
    void unschedule(const std::string& name);
    void post(Task task);

    // Runs every posted task, then every repeating task that is due.
    // A task that fell several intervals behind runs once, not once per
    // missed interval.
    void process();

    [[nodiscard]] size_t active_count() const;
    [[nodiscard]] const util::Clock& clock() const { return clock_; }

private:
    struct ScheduledTask {
        std::string name;
        Task task;
        std::chrono::milliseconds interval;
        int64_t next_run_ms;
        std::shared_ptr<bool> alive;
    };

    const util::Clock& clock_;
    std::map<uint64_t, ScheduledTask> tasks_;
    uint64_t next_id_ = 1;

    std::mutex posted_mutex_;
    std::vector<Task> posted_;
};

}  // namespace folio::events
