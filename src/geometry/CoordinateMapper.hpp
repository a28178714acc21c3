#pragma once

#include "geometry/Geometry.hpp"

namespace gamevision {

struct MatchResult;

// Window-relative <-> screen-absolute conversion. The mapping is a pure
// offset by the window's top-left corner; scaling has already been applied by
// the matcher. The WindowRect must come from the same capture as the match,
// a rect from an older capture silently yields wrong screen coordinates.

ScreenPoint toScreenPoint(Point location, const WindowRect& window);

ScreenRect toScreenRect(const Rect& box, const WindowRect& window);

Point toWindowPoint(ScreenPoint point, const WindowRect& window);

// Screen position of the centre of the match's bounding box.
ScreenPoint clickTarget(const MatchResult& match, const WindowRect& window);

}  // namespace gamevision
