#include "railmap/viewport/viewport_controller.h"
#include <cmath>

namespace railmap {

ViewportController::ViewportController()
    : ViewportController(ViewportConfig{}, InertiaConfig{}) {
}

ViewportController::ViewportController(const ViewportConfig& viewportConfig, const InertiaConfig& inertiaConfig)
    : viewportConfig_(viewportConfig),
      inertiaConfig_(inertiaConfig),
      view_{1.0, Point2{0.0, 0.0}} {
    view_.zoom = clampZoom(view_.zoom);
}

void ViewportController::configure(const ViewportConfig& viewportConfig, const InertiaConfig& inertiaConfig) {
    viewportConfig_ = viewportConfig;
    inertiaConfig_ = inertiaConfig;
    view_.zoom = clampZoom(view_.zoom);
}

double ViewportController::clampZoom(double zoom) const {
    return clampValue(zoom, viewportConfig_.zoomMin, viewportConfig_.zoomMax);
}

Point2 ViewportController::worldToScreen(const Point2& world) const {
    return world * view_.zoom + view_.pan;
}

Point2 ViewportController::screenToWorld(const Point2& screen) const {
    return (screen - view_.pan) / view_.zoom;
}

void ViewportController::zoomAt(const Point2& anchorScreen, double factor) {
    if (!std::isfinite(factor) || factor <= 0.0 || !isFinite(anchorScreen)) return;

    const double newZoom = clampZoom(view_.zoom * factor);
    // Resolved against the pre-update transform.
    const Point2 worldAnchor = screenToWorld(anchorScreen);
    view_.pan = anchorScreen - worldAnchor * newZoom;
    view_.zoom = newZoom;
}

void ViewportController::panBy(const Point2& delta) {
    if (!isFinite(delta)) return;
    view_.pan = view_.pan + delta;
}

void ViewportController::reset() {
    inertiaLoop_.cancel();
    inertiaVelocity_ = Point2{0.0, 0.0};
    view_.zoom = clampZoom(1.0);
    view_.pan = Point2{0.0, 0.0};
}

void ViewportController::setViewportSize(double width, double height) {
    if (!std::isfinite(width) || !std::isfinite(height) || width < 0.0 || height < 0.0) return;
    viewWidth_ = width;
    viewHeight_ = height;
}

void ViewportController::zoomIn() {
    zoomAt(Point2{viewWidth_ * 0.5, viewHeight_ * 0.5}, viewportConfig_.buttonZoomStep);
}

void ViewportController::zoomOut() {
    zoomAt(Point2{viewWidth_ * 0.5, viewHeight_ * 0.5}, 1.0 / viewportConfig_.buttonZoomStep);
}

int ViewportController::zoomPercent() const {
    return static_cast<int>(std::lround(view_.zoom * 100.0));
}

bool ViewportController::beginInertia(const Point2& velocity) {
    inertiaLoop_.cancel();
    if (!isFinite(velocity) || length(velocity) < inertiaConfig_.stopEpsilon) {
        inertiaVelocity_ = Point2{0.0, 0.0};
        return false;
    }
    inertiaVelocity_ = velocity;
    inertiaLoop_.start();
    return true;
}

bool ViewportController::stepInertia(double dtMs) {
    return stepInertia(inertiaLoop_.generation(), dtMs);
}

bool ViewportController::stepInertia(std::uint32_t token, double dtMs) {
    if (!inertiaLoop_.isCurrent(token)) return false;
    const double dt = (std::isfinite(dtMs) && dtMs > 0.0) ? dtMs : inertiaConfig_.frameMs;

    view_.pan = view_.pan + inertiaVelocity_ * dt;
    inertiaVelocity_ = inertiaVelocity_ * inertiaConfig_.decay;
    if (length(inertiaVelocity_) < inertiaConfig_.stopEpsilon) {
        inertiaVelocity_ = Point2{0.0, 0.0};
        inertiaLoop_.cancel();
        return false;
    }
    return true;
}

} // namespace railmap
