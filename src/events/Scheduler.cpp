#include "events/Scheduler.hpp"
#include "util/Logger.hpp"

namespace folio::events {

void TaskHandle::cancel() {
    if (alive_) {
        *alive_ = false;
    }
}

bool TaskHandle::active() const {
    return alive_ && *alive_;
}

Scheduler::Scheduler(const util::Clock& clock) : clock_(clock) {}

TaskHandle Scheduler::schedule(const std::string& name, std::chrono::milliseconds interval, Task task) {
    util::Logger::debug("Scheduler: Scheduling task '" + name + "' every " +
                        std::to_string(interval.count()) + "ms");

    auto alive = std::make_shared<bool>(true);
    uint64_t id = next_id_++;
    tasks_[id] = {name, std::move(task), interval, clock_.now_ms() + interval.count(), alive};
    return TaskHandle(alive);
}

void Scheduler::unschedule(const std::string& name) {
    util::Logger::debug("Scheduler: Unscheduling task '" + name + "'");

    for (auto& [id, task] : tasks_) {
        if (task.name == name) {
            *task.alive = false;
        }
    }
}

void Scheduler::post(Task task) {
    std::lock_guard<std::mutex> lock(posted_mutex_);
    posted_.push_back(std::move(task));
}

void Scheduler::process() {
    std::vector<Task> posted;
    {
        std::lock_guard<std::mutex> lock(posted_mutex_);
        posted.swap(posted_);
    }
    for (auto& task : posted) {
        task();
    }

    // Collect due ids first: tasks may schedule or cancel other tasks.
    auto now = clock_.now_ms();
    std::vector<uint64_t> due;
    for (const auto& [id, task] : tasks_) {
        if (*task.alive && now >= task.next_run_ms) {
            due.push_back(id);
        }
    }

    for (auto id : due) {
        auto it = tasks_.find(id);
        if (it == tasks_.end() || !*it->second.alive) continue;
        it->second.next_run_ms = now + it->second.interval.count();
        Task task = it->second.task;
        task();
    }

    std::erase_if(tasks_, [](const auto& entry) { return !*entry.second.alive; });
}

size_t Scheduler::active_count() const {
    size_t count = 0;
    for (const auto& [id, task] : tasks_) {
        if (*task.alive) ++count;
    }
    return count;
}

}  // namespace folio::events
