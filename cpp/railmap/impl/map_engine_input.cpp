// MapEngine viewport commands and raw input forwarding.

#include "railmap/map_engine.h"

namespace railmap {

void MapEngine::zoomAt(const Point2& anchorScreen, double factor) {
    viewport_.zoomAt(anchorScreen, factor);
}

void MapEngine::panBy(const Point2& delta) {
    viewport_.panBy(delta);
}

void MapEngine::resetView() {
    viewport_.reset();
}

void MapEngine::zoomIn() {
    viewport_.zoomIn();
}

void MapEngine::zoomOut() {
    viewport_.zoomOut();
}

void MapEngine::pointerDown(const Point2& screen, double timeMs) {
    gestures_.pointerDown(screen, timeMs);
}

void MapEngine::pointerMove(const Point2& screen, double timeMs) {
    gestures_.pointerMove(screen, timeMs);
}

void MapEngine::pointerUp(double timeMs) {
    gestures_.pointerUp(timeMs);
}

void MapEngine::touchStart(const std::vector<Point2>& touches, double timeMs) {
    gestures_.touchStart(touches.data(), touches.size(), timeMs);
}

void MapEngine::touchMove(const std::vector<Point2>& touches, double timeMs) {
    gestures_.touchMove(touches.data(), touches.size(), timeMs);
}

void MapEngine::touchEnd(std::uint32_t remaining, double timeMs) {
    gestures_.touchEnd(remaining, timeMs);
}

void MapEngine::wheel(const Point2& cursor, double deltaY) {
    gestures_.wheel(cursor, deltaY);
}

void MapEngine::doubleClick(const Point2& point) {
    gestures_.doubleClick(point);
}

} // namespace railmap
