#pragma once

namespace gamevision {

// Window-relative pixel position, measured from the top-left of a captured
// buffer.
struct Point {
    int x = 0;
    int y = 0;
};

inline bool operator==(const Point& a, const Point& b) {
    return a.x == b.x && a.y == b.y;
}

inline bool operator!=(const Point& a, const Point& b) {
    return !(a == b);
}

// Half-open window-relative rectangle [min, max).
struct Rect {
    int minX = 0;
    int minY = 0;
    int maxX = 0;
    int maxY = 0;

    int width() const {
        return maxX - minX;
    }
    int height() const {
        return maxY - minY;
    }
    bool empty() const {
        return width() <= 0 || height() <= 0;
    }
    Point min() const {
        return {minX, minY};
    }
    Point center() const {
        return {minX + width() / 2, minY + height() / 2};
    }
    bool contains(Point p) const {
        return p.x >= minX && p.y >= minY && p.x < maxX && p.y < maxY;
    }
};

inline bool operator==(const Rect& a, const Rect& b) {
    return a.minX == b.minX && a.minY == b.minY && a.maxX == b.maxX &&
           a.maxY == b.maxY;
}

inline bool operator!=(const Rect& a, const Rect& b) {
    return !(a == b);
}

struct ScreenPoint {
    int x = 0;
    int y = 0;
};

inline bool operator==(const ScreenPoint& a, const ScreenPoint& b) {
    return a.x == b.x && a.y == b.y;
}

// Screen-absolute rectangle. A captured window's rectangle is one of these.
struct ScreenRect {
    int minX = 0;
    int minY = 0;
    int maxX = 0;
    int maxY = 0;

    int width() const {
        return maxX - minX;
    }
    int height() const {
        return maxY - minY;
    }
    bool empty() const {
        return width() <= 0 || height() <= 0;
    }
    bool contains(ScreenPoint p) const {
        return p.x >= minX && p.y >= minY && p.x < maxX && p.y < maxY;
    }
};

inline bool operator==(const ScreenRect& a, const ScreenRect& b) {
    return a.minX == b.minX && a.minY == b.minY && a.maxX == b.maxX &&
           a.maxY == b.maxY;
}

using WindowRect = ScreenRect;

}  // namespace gamevision
