#pragma once

#include "railmap/core/map_config.h"
#include "railmap/core/types.h"
#include "railmap/viewport/animation_loop.h"
#include <cstdint>

namespace railmap {

// screen = world * zoom + pan
struct Viewport {
    double zoom;
    Point2 pan;
};

class ViewportController {
public:
    ViewportController();
    ViewportController(const ViewportConfig& viewportConfig, const InertiaConfig& inertiaConfig);

    // Re-clamps the current zoom into the new bounds.
    void configure(const ViewportConfig& viewportConfig, const InertiaConfig& inertiaConfig);

    const Viewport& viewport() const noexcept { return view_; }
    double zoom() const noexcept { return view_.zoom; }
    const Point2& pan() const noexcept { return view_.pan; }
    double zoomMin() const noexcept { return viewportConfig_.zoomMin; }
    double zoomMax() const noexcept { return viewportConfig_.zoomMax; }

    Point2 worldToScreen(const Point2& world) const;
    Point2 screenToWorld(const Point2& screen) const;

    // Scales zoom by `factor` (clamped) keeping the world point under
    // `anchorScreen` fixed on screen. Non-finite or non-positive factors are ignored.
    void zoomAt(const Point2& anchorScreen, double factor);
    void panBy(const Point2& delta);
    void reset();

    // Button zoom about the centre of the viewport (origin when size unknown).
    void setViewportSize(double width, double height);
    void zoomIn();
    void zoomOut();
    int zoomPercent() const;

    // ---------------------------------------------------------------------
    // Inertia
    // ---------------------------------------------------------------------

    // Starts a decaying pan at `velocity` (screen units per ms). Returns false
    // without starting when the velocity is already below the stop epsilon.
    bool beginInertia(const Point2& velocity);

    // One inertia frame of `dtMs` (the configured frame when <= 0). Returns
    // true while the animation is still running afterwards.
    bool stepInertia(double dtMs = 0.0);
    bool stepInertia(std::uint32_t token, double dtMs);

    void cancelInertia() noexcept { inertiaLoop_.cancel(); }
    bool isInertiaActive() const noexcept { return inertiaLoop_.isRunning(); }
    std::uint32_t inertiaToken() const noexcept { return inertiaLoop_.generation(); }
    const Point2& inertiaVelocity() const noexcept { return inertiaVelocity_; }

private:
    ViewportConfig viewportConfig_;
    InertiaConfig inertiaConfig_;
    Viewport view_;
    double viewWidth_{0.0};
    double viewHeight_{0.0};

    AnimationLoop inertiaLoop_;
    Point2 inertiaVelocity_{0.0, 0.0};

    double clampZoom(double zoom) const;
};

} // namespace railmap
