#pragma once

#include "railmap/protocol/protocol_types.h"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace railmap {

// Bounded FIFO of outgoing events. When the ring fills up it drops
// everything queued and reports a single Overflow event on the next drain;
// the host is expected to re-read full state after that.
class EventQueue {
public:
    explicit EventQueue(std::size_t capacity);

    bool push(const protocol::MapEvent& ev);

    void recordEntityCreated(EntityId id, WaypointId waypoint, const Point2& world);
    void recordEntityMoved(EntityId id, const Point2& world);
    void recordWaypointReached(EntityId id, WaypointId waypoint, const Point2& world);

    // Removes and returns up to `maxEvents` events (0 = all).
    std::vector<protocol::MapEvent> drain(std::size_t maxEvents = 0);

    void clear() noexcept;

    std::size_t size() const noexcept { return count_ + (overflowed_ ? 1 : 0); }
    bool overflowed() const noexcept { return overflowed_; }
    std::size_t capacity() const noexcept { return ring_.size(); }

private:
    std::vector<protocol::MapEvent> ring_;
    std::size_t head_{0};
    std::size_t tail_{0};
    std::size_t count_{0};
    bool overflowed_{false};
};

} // namespace railmap
