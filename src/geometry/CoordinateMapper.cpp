#include "geometry/CoordinateMapper.hpp"

#include "match/MatchTypes.hpp"

namespace gamevision {

ScreenPoint toScreenPoint(Point location, const WindowRect& window) {
    return {window.minX + location.x, window.minY + location.y};
}

ScreenRect toScreenRect(const Rect& box, const WindowRect& window) {
    ScreenRect out;
    out.minX = window.minX + box.minX;
    out.minY = window.minY + box.minY;
    out.maxX = window.minX + box.maxX;
    out.maxY = window.minY + box.maxY;
    return out;
}

Point toWindowPoint(ScreenPoint point, const WindowRect& window) {
    return {point.x - window.minX, point.y - window.minY};
}

ScreenPoint clickTarget(const MatchResult& match, const WindowRect& window) {
    return toScreenPoint(match.boundingBox.center(), window);
}

}  // namespace gamevision
