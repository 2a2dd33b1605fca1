#include "railmap/events/event_queue.h"
#include "railmap/core/logging.h"

namespace railmap {

using protocol::EventType;
using protocol::MapEvent;

EventQueue::EventQueue(std::size_t capacity)
    : ring_(capacity > 0 ? capacity : 1) {
}

bool EventQueue::push(const MapEvent& ev) {
    if (overflowed_) return false;
    if (count_ >= ring_.size()) {
        RAILMAP_LOG_WARN("event queue overflow after %zu events", count_);
        overflowed_ = true;
        head_ = 0;
        tail_ = 0;
        count_ = 0;
        return false;
    }
    ring_[tail_] = ev;
    tail_ = (tail_ + 1) % ring_.size();
    count_++;
    return true;
}

void EventQueue::recordEntityCreated(EntityId id, WaypointId waypoint, const Point2& world) {
    push(MapEvent{static_cast<std::uint16_t>(EventType::EntityCreated), 0, id, waypoint, world.x, world.y});
}

void EventQueue::recordEntityMoved(EntityId id, const Point2& world) {
    push(MapEvent{static_cast<std::uint16_t>(EventType::EntityMoved), 0, id, kInvalidWaypointId, world.x, world.y});
}

void EventQueue::recordWaypointReached(EntityId id, WaypointId waypoint, const Point2& world) {
    push(MapEvent{static_cast<std::uint16_t>(EventType::WaypointReached), 0, id, waypoint, world.x, world.y});
}

std::vector<MapEvent> EventQueue::drain(std::size_t maxEvents) {
    std::vector<MapEvent> out;
    if (overflowed_) {
        overflowed_ = false;
        out.push_back(MapEvent{static_cast<std::uint16_t>(EventType::Overflow), 0,
                               kInvalidEntityId, kInvalidWaypointId, 0.0, 0.0});
        return out;
    }

    std::size_t n = count_;
    if (maxEvents > 0 && maxEvents < n) n = maxEvents;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(ring_[head_]);
        head_ = (head_ + 1) % ring_.size();
    }
    count_ -= n;
    return out;
}

void EventQueue::clear() noexcept {
    head_ = 0;
    tail_ = 0;
    count_ = 0;
    overflowed_ = false;
}

} // namespace railmap
