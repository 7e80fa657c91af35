#pragma once

#include "backend/SnapshotBuffers.hpp"
#include "model/Snapshot.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

namespace folio::backend {

class SnapshotPublisher {
public:
    SnapshotPublisher() = default;

    void publish(model::Snapshot snap);
    void update(const std::function<void(model::Snapshot&)>& updater);

    [[nodiscard]] std::shared_ptr<const model::Snapshot> get_current() const;

    // Lock-free; lets a poller skip get_current() when nothing changed.
    [[nodiscard]] uint64_t seq() const { return buffers_.seq(); }

private:
    SnapshotBuffers buffers_;
    mutable std::mutex mutex_;
};

}  // namespace folio::backend
