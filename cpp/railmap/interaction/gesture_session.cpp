#include "railmap/interaction/gesture_session.h"
#include "railmap/core/logging.h"
#include <algorithm>
#include <cmath>

namespace railmap {

using protocol::GestureState;

namespace {
Point2 midpoint(const Point2& a, const Point2& b) {
    return Point2{(a.x + b.x) * 0.5, (a.y + b.y) * 0.5};
}

bool validSample(const Point2& p, double timeMs) {
    return isFinite(p) && std::isfinite(timeMs);
}
} // namespace

GestureSessionManager::GestureSessionManager(ViewportController& viewport, EntityStore& entities,
                                             const PathRegistry& registry, PathAnimator& animator,
                                             EventQueue& events)
    : viewport_(viewport), entities_(entities), registry_(registry), animator_(animator), events_(events) {
    scratchPath_.reserve(16);
}

void GestureSessionManager::beginSession(GestureState state, const Point2& screen, double timeMs) {
    session_ = SessionState{};
    session_.state = state;
    session_.lastPoint = screen;
    session_.lastTimeMs = timeMs;
}

void GestureSessionManager::pointerDown(const Point2& screen, double timeMs) {
    if (!validSample(screen, timeMs)) return;

    // A new gesture always wins over a coasting pan.
    viewport_.cancelInertia();

    const Point2 world = viewport_.screenToWorld(screen);
    const double pickRadius = config_.pickTolerancePx / viewport_.zoom();
    const EntityId hit = entities_.pick(world, pickRadius);

    if (hit != kInvalidEntityId) {
        beginSession(GestureState::DraggingEntity, screen, timeMs);
        session_.entityId = hit;
        return;
    }

    if (placeMode_) {
        const EntityId created = placeEntity(world);
        beginSession(GestureState::DraggingEntity, screen, timeMs);
        session_.entityId = created;
        return;
    }

    beginSession(GestureState::Panning, screen, timeMs);
}

EntityId GestureSessionManager::placeEntity(const Point2& world) {
    EntityRecord rec{};
    rec.id = entities_.allocateId();
    rec.kind = EntityKind::Manual;
    rec.position = world;
    rec.tangent = Point2{1.0, 0.0};
    rec.laneOffset = Point2{0.0, 0.0};
    rec.boundToPath = false;
    rec.draggable = true;
    rec.maxSpeed = map_constants::MANUAL_MAX_SPEED;
    rec.homeWaypoint = registry_.nearestWaypoint(world);
    entities_.upsert(rec);

    RAILMAP_LOG_DEBUG("placed manual entity %u near waypoint %u", rec.id, rec.homeWaypoint);
    events_.recordEntityCreated(rec.id, rec.homeWaypoint, world);
    return rec.id;
}

void GestureSessionManager::pointerMove(const Point2& screen, double timeMs) {
    if (!validSample(screen, timeMs)) return;

    switch (session_.state) {
        case GestureState::Panning: {
            const Point2 delta = screen - session_.lastPoint;
            viewport_.panBy(delta);
            const double dt = std::max(config_.velocityMinDtMs, timeMs - session_.lastTimeMs);
            session_.velocity = delta / dt;
            session_.lastPoint = screen;
            session_.lastTimeMs = timeMs;
            break;
        }
        case GestureState::DraggingEntity:
            dragEntityTo(screen);
            session_.lastPoint = screen;
            session_.lastTimeMs = timeMs;
            break;
        case GestureState::Idle:
        case GestureState::Pinching:
            break;
    }
}

void GestureSessionManager::dragEntityTo(const Point2& screen) {
    EntityRecord* rec = entities_.get(session_.entityId);
    if (!rec) {
        session_ = SessionState{};
        return;
    }

    const Point2 world = viewport_.screenToWorld(screen);
    Point2 target = world;
    if (rec->boundToPath) {
        // Bound entities stay on the rail of their current leg.
        const PathProgress* prog = animator_.ensureProgress(rec->id);
        if (prog && registry_.resolvePath(prog->currentWaypoint, prog->nextWaypoint, scratchPath_)
            && scratchPath_.size() >= 2) {
            const PolylineProjection proj = projectOntoPolyline(world, scratchPath_);
            target = proj.point;
            rec->tangent = scratchPath_[proj.segmentIndex + 1] - scratchPath_[proj.segmentIndex];
        }
    }
    rec->position = target;
    rec->laneOffset = Point2{0.0, 0.0};
    events_.recordEntityMoved(rec->id, target);
}

void GestureSessionManager::pointerUp(double /*timeMs*/) {
    const bool wasPanning = session_.state == GestureState::Panning;
    const Point2 velocity = session_.velocity;
    session_ = SessionState{};

    if (wasPanning && length(velocity) > config_.inertiaStartThreshold) {
        viewport_.beginInertia(velocity);
    }
}

void GestureSessionManager::touchStart(const Point2* touches, std::size_t count, double timeMs) {
    if (!touches || count == 0) return;
    if (count >= 2) {
        if (!isFinite(touches[0]) || !isFinite(touches[1])) return;
        viewport_.cancelInertia();
        beginPinch(touches[0], touches[1]);
        return;
    }
    pointerDown(touches[0], timeMs);
}

void GestureSessionManager::beginPinch(const Point2& a, const Point2& b) {
    // Pinching replaces any pan or drag; the abandoned pan gets no inertia.
    session_ = SessionState{};
    session_.state = GestureState::Pinching;
    session_.pinch.startDistance = distance(a, b);
    session_.pinch.lastDistance = session_.pinch.startDistance;
    session_.pinch.lastCenter = midpoint(a, b);
}

void GestureSessionManager::touchMove(const Point2* touches, std::size_t count, double timeMs) {
    if (!touches || count == 0) return;
    if (session_.state == GestureState::Pinching) {
        if (count >= 2 && isFinite(touches[0]) && isFinite(touches[1])) {
            updatePinch(touches[0], touches[1]);
        }
        return;
    }
    if (count == 1) {
        pointerMove(touches[0], timeMs);
    }
}

void GestureSessionManager::updatePinch(const Point2& a, const Point2& b) {
    const double dist = distance(a, b);
    const Point2 center = midpoint(a, b);
    const double factor = dist / std::max(config_.pinchMinDistancePx, session_.pinch.lastDistance);
    viewport_.zoomAt(center, factor);
    session_.pinch.lastDistance = dist;
    session_.pinch.lastCenter = center;
}

void GestureSessionManager::touchEnd(std::size_t remaining, double timeMs) {
    if (session_.state == GestureState::Pinching) {
        // Lifting one finger of a pinch ends the gesture; it does not resume a pan.
        if (remaining < 2) session_ = SessionState{};
        return;
    }
    if (remaining == 0) {
        pointerUp(timeMs);
    }
}

void GestureSessionManager::wheel(const Point2& cursor, double deltaY) {
    if (!std::isfinite(deltaY)) return;
    viewport_.cancelInertia();
    viewport_.zoomAt(cursor, deltaY > 0.0 ? config_.wheelZoomOutFactor : config_.wheelZoomInFactor);
}

void GestureSessionManager::doubleClick(const Point2& point) {
    viewport_.cancelInertia();
    viewport_.zoomAt(point, config_.doubleClickZoomFactor);
}

void GestureSessionManager::cancel() {
    session_ = SessionState{};
}

void GestureSessionManager::releaseEntity(EntityId id) {
    if (session_.state == GestureState::DraggingEntity && session_.entityId == id) {
        session_ = SessionState{};
    }
}

} // namespace railmap
