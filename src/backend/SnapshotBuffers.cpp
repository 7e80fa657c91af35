#include "backend/SnapshotBuffers.hpp"
#include <memory>
#include <vector>

namespace folio::backend {

SnapshotBuffers::SnapshotBuffers() {
    auto no_bookmarks = std::make_shared<const std::vector<model::Bookmark>>();
    a_.bookmarks = no_bookmarks;
    b_.bookmarks = no_bookmarks;

    front_.store(&a_);
    back_ = &b_;
}

model::Snapshot& SnapshotBuffers::back() {
    return *back_;
}

void SnapshotBuffers::publish() {
    back_->seq = front_.load(std::memory_order_acquire)->seq + 1;

    auto* old_front = front_.load(std::memory_order_relaxed);
    front_.store(back_, std::memory_order_release);
    back_ = old_front;

    // Next producer starts from what was just published
    *back_ = *front_.load(std::memory_order_acquire);
}

const model::Snapshot& SnapshotBuffers::front() const {
    return *front_.load(std::memory_order_acquire);
}

uint64_t SnapshotBuffers::seq() const {
    return front().seq;
}

}  // namespace folio::backend
