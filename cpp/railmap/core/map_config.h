#pragma once

#include "railmap/core/map_constants.h"

namespace railmap {

struct ViewportConfig {
    double zoomMin = map_constants::ZOOM_MIN;
    double zoomMax = map_constants::ZOOM_MAX;
    double buttonZoomStep = map_constants::ZOOM_BUTTON_STEP;
};

struct InertiaConfig {
    double decay = map_constants::INERTIA_DECAY;
    double stopEpsilon = map_constants::INERTIA_STOP_EPSILON;
    double frameMs = map_constants::INERTIA_FRAME_MS;
};

struct GestureConfig {
    double velocityMinDtMs = map_constants::VELOCITY_MIN_DT_MS;
    double inertiaStartThreshold = map_constants::INERTIA_START_THRESHOLD;
    double pinchMinDistancePx = map_constants::PINCH_MIN_DISTANCE_PX;
    double pickTolerancePx = map_constants::PICK_TOLERANCE_PX;
    double wheelZoomOutFactor = map_constants::WHEEL_ZOOM_OUT_FACTOR;
    double wheelZoomInFactor = map_constants::WHEEL_ZOOM_IN_FACTOR;
    double doubleClickZoomFactor = map_constants::DOUBLE_CLICK_ZOOM_FACTOR;
};

struct AnimatorConfig {
    double tickMs = map_constants::ANIMATION_TICK_MS;
    double referenceSpeed = map_constants::REFERENCE_SPEED;
    double delayedFactor = map_constants::DELAYED_FACTOR;
    double baseRate = map_constants::BASE_PROGRESS_RATE;
    double lateralSpacing = map_constants::LATERAL_SPACING;
    unsigned laneCount = map_constants::LANE_COUNT;
};

struct MapConfig {
    ViewportConfig viewport;
    InertiaConfig inertia;
    GestureConfig gesture;
    AnimatorConfig animator;
};

// Returns false (and leaves nothing modified) when any value is non-finite
// or out of its valid range. See map_config.cpp for the exact rules.
bool validateConfig(const MapConfig& config);

} // namespace railmap
