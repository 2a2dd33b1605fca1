#include "railmap/core/map_config.h"
#include "railmap/core/logging.h"
#include <cmath>

namespace railmap {

namespace {
bool positiveFinite(double v) {
    return std::isfinite(v) && v > 0.0;
}
} // namespace

bool validateConfig(const MapConfig& config) {
    const ViewportConfig& vp = config.viewport;
    if (!positiveFinite(vp.zoomMin) || !positiveFinite(vp.zoomMax) || vp.zoomMin > vp.zoomMax) {
        RAILMAP_LOG_WARN("rejected zoom bounds [%f, %f]", vp.zoomMin, vp.zoomMax);
        return false;
    }
    if (!positiveFinite(vp.buttonZoomStep)) {
        RAILMAP_LOG_WARN("rejected button zoom step %f", vp.buttonZoomStep);
        return false;
    }

    const InertiaConfig& in = config.inertia;
    if (!std::isfinite(in.decay) || in.decay <= 0.0 || in.decay >= 1.0) {
        RAILMAP_LOG_WARN("rejected inertia decay %f", in.decay);
        return false;
    }
    if (!positiveFinite(in.stopEpsilon) || !positiveFinite(in.frameMs)) {
        RAILMAP_LOG_WARN("rejected inertia epsilon/frame %f/%f", in.stopEpsilon, in.frameMs);
        return false;
    }

    const GestureConfig& g = config.gesture;
    if (!positiveFinite(g.velocityMinDtMs) || !positiveFinite(g.pinchMinDistancePx)) {
        RAILMAP_LOG_WARN("rejected gesture divisor floors");
        return false;
    }
    if (!std::isfinite(g.inertiaStartThreshold) || g.inertiaStartThreshold < 0.0) {
        RAILMAP_LOG_WARN("rejected inertia start threshold %f", g.inertiaStartThreshold);
        return false;
    }
    if (!std::isfinite(g.pickTolerancePx) || g.pickTolerancePx < 0.0) {
        RAILMAP_LOG_WARN("rejected pick tolerance %f", g.pickTolerancePx);
        return false;
    }
    if (!positiveFinite(g.wheelZoomOutFactor) || !positiveFinite(g.wheelZoomInFactor)
        || !positiveFinite(g.doubleClickZoomFactor)) {
        RAILMAP_LOG_WARN("rejected wheel/double-click zoom factors");
        return false;
    }

    const AnimatorConfig& a = config.animator;
    if (!positiveFinite(a.tickMs) || !positiveFinite(a.referenceSpeed)) {
        RAILMAP_LOG_WARN("rejected animator tick %f / reference speed %f", a.tickMs, a.referenceSpeed);
        return false;
    }
    if (!std::isfinite(a.delayedFactor) || a.delayedFactor < 0.0
        || !std::isfinite(a.baseRate) || a.baseRate < 0.0) {
        RAILMAP_LOG_WARN("rejected animator rates");
        return false;
    }
    if (!std::isfinite(a.lateralSpacing) || a.lateralSpacing < 0.0 || a.laneCount == 0) {
        RAILMAP_LOG_WARN("rejected lane spacing %f x %u", a.lateralSpacing, a.laneCount);
        return false;
    }
    return true;
}

} // namespace railmap
