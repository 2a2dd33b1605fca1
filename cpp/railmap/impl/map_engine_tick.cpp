// MapEngine animation loops, event polling and statistics.

#include "railmap/map_engine.h"
#include "railmap/core/util.h"

namespace railmap {

bool MapEngine::stepInertia(double dtMs) {
    return viewport_.stepInertia(dtMs);
}

void MapEngine::startAnimation() {
    animator_.start();
}

void MapEngine::stopAnimation() {
    animator_.stop();
}

bool MapEngine::tickAnimation() {
    const double t0 = nowMs();
    const bool ticked = animator_.tick(gestures_.draggedEntity());
    if (ticked) lastTickMs_ = nowMs() - t0;
    return ticked;
}

void MapEngine::teardown() {
    viewport_.cancelInertia();
    animator_.stop();
    gestures_.cancel();
}

std::vector<protocol::MapEvent> MapEngine::pollEvents(std::uint32_t maxEvents) {
    return events_.drain(maxEvents);
}

protocol::MapStats MapEngine::getStats() const {
    protocol::MapStats stats{};
    stats.entityCount = static_cast<std::uint32_t>(entities_.size());
    stats.trackedProgressCount = static_cast<std::uint32_t>(animator_.trackedCount());
    stats.waypointCount = static_cast<std::uint32_t>(registry_.waypoints().size());
    stats.lineCount = static_cast<std::uint32_t>(registry_.lines().size());
    stats.topologyGeneration = registry_.generation();
    stats.animationTickCount = animator_.tickCount();
    stats.unresolvedPathCount = animator_.lastUnresolvedCount();
    stats.pendingEventCount = static_cast<std::uint32_t>(events_.size());
    stats.lastTickMs = lastTickMs_;
    return stats;
}

} // namespace railmap
