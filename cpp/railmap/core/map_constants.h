#pragma once

/**
 * @file map_constants.h
 * @brief Default tuning values for the map viewport and path animation.
 *
 * These are the defaults MapConfig starts from. Frontend code that renders
 * zoom buttons or a zoom readout should read the live values from the engine
 * instead of duplicating them.
 */

namespace railmap {
namespace map_constants {

// =============================================================================
// Zoom
// =============================================================================

/// Lower zoom bound (30%)
constexpr double ZOOM_MIN = 0.3;

/// Upper zoom bound (300%)
constexpr double ZOOM_MAX = 3.0;

/// Factor applied by the zoom-in button (zoom-out uses the reciprocal)
constexpr double ZOOM_BUTTON_STEP = 1.2;

/// Wheel factor when deltaY > 0 (scroll down, zoom out)
constexpr double WHEEL_ZOOM_OUT_FACTOR = 0.9;

/// Wheel factor when deltaY <= 0 (scroll up, zoom in)
constexpr double WHEEL_ZOOM_IN_FACTOR = 1.1;

/// Double-click zoom factor
constexpr double DOUBLE_CLICK_ZOOM_FACTOR = 1.25;

// =============================================================================
// Inertia
// =============================================================================

/// Per-frame velocity multiplier after a drag release
constexpr double INERTIA_DECAY = 0.95;

/// Inertia stops once |velocity| drops below this (screen units per ms)
constexpr double INERTIA_STOP_EPSILON = 0.01;

/// Default frame duration for one inertia step (ms)
constexpr double INERTIA_FRAME_MS = 16.0;

// =============================================================================
// Gestures
// =============================================================================

/// Floor for the velocity estimate divisor; avoids spikes from near-zero dt
constexpr double VELOCITY_MIN_DT_MS = 16.0;

/// Release velocity above which inertia starts (screen units per ms)
constexpr double INERTIA_START_THRESHOLD = 0.01;

/// Floor for the previous pinch distance used as a divisor (px)
constexpr double PINCH_MIN_DISTANCE_PX = 1.0;

/// Hit radius for grabbing an entity marker (screen px, divided by zoom)
constexpr double PICK_TOLERANCE_PX = 10.0;

// =============================================================================
// Path animation
// =============================================================================

/// Period of the path animator tick (ms). Informational for the host scheduler.
constexpr double ANIMATION_TICK_MS = 1500.0;

/// Speed that maps to speedFactor 1.0 (km/h)
constexpr double REFERENCE_SPEED = 100.0;

/// Progress multiplier applied while an entity carries a positive delay
constexpr double DELAYED_FACTOR = 0.7;

/// Progress added per tick at the reference speed with no delay
constexpr double BASE_PROGRESS_RATE = 0.015;

/// Perpendicular distance between adjacent marker lanes (world units)
constexpr double LATERAL_SPACING = 6.0;

/// Number of marker lanes used for de-overlap
constexpr unsigned LANE_COUNT = 3;

/// Speed cap for user-placed entities (km/h)
constexpr double MANUAL_MAX_SPEED = 120.0;

// =============================================================================
// Events
// =============================================================================

/// Capacity of the outgoing event ring
constexpr unsigned EVENT_QUEUE_CAPACITY = 1024;

} // namespace map_constants
} // namespace railmap
