#pragma once

#include "model/Snapshot.hpp"
#include <atomic>
#include <cstdint>

namespace folio::backend {

// Ping-pong pair of snapshots. The producer edits back() and publish()
// swaps it to the front. Callers serialize producers.
class SnapshotBuffers {
public:
    SnapshotBuffers();

    SnapshotBuffers(const SnapshotBuffers&) = delete;
    SnapshotBuffers& operator=(const SnapshotBuffers&) = delete;

    [[nodiscard]] model::Snapshot& back();

    // Swap front/back, bump the sequence and carry the published state
    // into the new back buffer.
    void publish();

    [[nodiscard]] const model::Snapshot& front() const;
    [[nodiscard]] uint64_t seq() const;

private:
    model::Snapshot a_;
    model::Snapshot b_;

    std::atomic<model::Snapshot*> front_;
    model::Snapshot* back_;
};

}  // namespace folio::backend
