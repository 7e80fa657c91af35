#include "backend/SnapshotPublisher.hpp"

namespace folio::backend {

void SnapshotPublisher::publish(model::Snapshot snap) {
    std::lock_guard<std::mutex> lock(mutex_);
    buffers_.back() = std::move(snap);
    buffers_.publish();
}

void SnapshotPublisher::update(const std::function<void(model::Snapshot&)>& updater) {
    // Called on every engine status; do not log here
    std::lock_guard<std::mutex> lock(mutex_);
    updater(buffers_.back());
    buffers_.publish();
}

std::shared_ptr<const model::Snapshot> SnapshotPublisher::get_current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::make_shared<model::Snapshot>(buffers_.front());
}

}  // namespace folio::backend
