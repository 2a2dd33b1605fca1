#include "railmap/animation/path_animator.h"
#include "railmap/core/logging.h"
#include "railmap/network/route.h"
#include <cmath>

namespace railmap {

namespace {
double seedProgress(double p) {
    if (!std::isfinite(p) || p < 0.0 || p >= 1.0) return 0.0;
    return p;
}
} // namespace

PathAnimator::PathAnimator(EntityStore& entities, const PathRegistry& registry, EventQueue& events)
    : entities_(entities), registry_(registry), events_(events) {
}

const PathProgress* PathAnimator::ensureProgress(EntityId id) {
    const auto it = progress_.find(id);
    if (it != progress_.end()) return &it->second;

    const EntityRecord* rec = entities_.get(id);
    if (!rec || rec->kind == EntityKind::Manual || !rec->boundToPath || rec->route.empty()) {
        return nullptr;
    }

    PathProgress prog{};
    prog.entityId = id;
    prog.progress = seedProgress(rec->initialProgress);
    prog.currentWaypoint = rec->route.front();
    prog.nextWaypoint = rec->route.size() > 1 ? rec->route[1] : rec->route.front();
    return &progress_.emplace(id, prog).first->second;
}

const PathProgress* PathAnimator::progressOf(EntityId id) const {
    const auto it = progress_.find(id);
    return it == progress_.end() ? nullptr : &it->second;
}

bool PathAnimator::setProgress(EntityId id, double progress) {
    if (!ensureProgress(id)) return false;
    progress_[id].progress = seedProgress(progress);
    return true;
}

double PathAnimator::incrementFor(const EntityRecord& rec) const {
    const double speed = (std::isfinite(rec.speed) && rec.speed > 0.0) ? rec.speed : 0.0;
    const double speedFactor = speed / config_.referenceSpeed;
    const double delayFactor = rec.delay > 0.0 ? config_.delayedFactor : 1.0;
    return speedFactor * delayFactor * config_.baseRate;
}

bool PathAnimator::tick(EntityId dragSuppressedId) {
    return tick(loop_.generation(), dragSuppressedId);
}

bool PathAnimator::tick(std::uint32_t token, EntityId dragSuppressedId) {
    if (!loop_.isCurrent(token)) return false;

    lastUnresolved_ = 0;
    for (const EntityId id : entities_.order()) {
        EntityRecord* rec = entities_.get(id);
        if (!rec || rec->kind == EntityKind::Manual || !rec->boundToPath) continue;
        if (!ensureProgress(id)) continue;
        advance(*rec, progress_[id], id != dragSuppressedId);
    }
    tickCount_++;
    return true;
}

void PathAnimator::advance(EntityRecord& rec, PathProgress& prog, bool writePosition) {
    // Single-waypoint routes park at that waypoint.
    if (prog.currentWaypoint == prog.nextWaypoint) {
        holdAtWaypoint(rec, prog.currentWaypoint, writePosition);
        return;
    }
    if (!registry_.resolvePath(prog.currentWaypoint, prog.nextWaypoint, scratchPath_)) {
        lastUnresolved_++;
        holdAtWaypoint(rec, prog.currentWaypoint, writePosition);
        return;
    }

    prog.progress += incrementFor(rec);
    if (prog.progress >= 1.0) {
        prog.progress = 0.0;
        prog.currentWaypoint = prog.nextWaypoint;
        prog.nextWaypoint = routeSuccessor(rec.route, prog.currentWaypoint);

        const Waypoint* reached = registry_.getWaypoint(prog.currentWaypoint);
        const Point2 at = reached ? reached->position : rec.position;
        events_.recordWaypointReached(rec.id, prog.currentWaypoint, at);

        // Sample the new leg so the rollover tick does not jump back to the
        // start of the leg just finished.
        if (!registry_.resolvePath(prog.currentWaypoint, prog.nextWaypoint, scratchPath_)) {
            lastUnresolved_++;
            holdAtWaypoint(rec, prog.currentWaypoint, writePosition);
            return;
        }
    }

    if (!writePosition) return;
    const PathSample sample = pointAlongPath(scratchPath_, prog.progress);
    rec.position = sample.position;
    rec.tangent = sample.tangent;
    rec.laneOffset = laneOffset(rec, sample.tangent);
}

void PathAnimator::holdAtWaypoint(EntityRecord& rec, WaypointId waypoint, bool writePosition) {
    RAILMAP_LOG_DEBUG("entity %u holding at waypoint %u", rec.id, waypoint);
    if (!writePosition) return;
    if (const Waypoint* wp = registry_.getWaypoint(waypoint)) {
        rec.position = wp->position;
    }
}

Point2 PathAnimator::laneOffset(const EntityRecord& rec, const Point2& tangent) const {
    if (config_.lateralSpacing <= 0.0 || config_.laneCount == 0) return Point2{0.0, 0.0};
    const Point2 normal = normalized(perpendicular(tangent));
    const double lane = static_cast<double>(rec.laneIndex % config_.laneCount);
    const double centre = (static_cast<double>(config_.laneCount) - 1.0) * 0.5;
    return normal * ((lane - centre) * config_.lateralSpacing);
}

} // namespace railmap
