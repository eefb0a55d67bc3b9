#ifndef HUMAN_CURSOR_TYPES_HPP_
#define HUMAN_CURSOR_TYPES_HPP_

#include <chrono>
#include <vector>

/**
 * Integer screen coordinate in pixels.
 * Used for the path waypoints and for the pointer position reported by the device.
 */
struct Point {
    int x;  // Horizontal pixel coordinate
    int y;  // Vertical pixel coordinate
};

inline bool operator==(const Point& a, const Point& b)
{
    return a.x == b.x && a.y == b.y;
}

inline bool operator!=(const Point& a, const Point& b)
{
    return !(a == b);
}

/**
 * One scheduled replay step.
 * The points are visited in order, then the delay elapses before the next step.
 */
struct Movement {
    std::chrono::milliseconds delay;  // Time to hold after the last point
    std::vector<Point> points;        // Waypoints to visit, never empty
};

// Number of waypoints in a generated path, endpoints included
constexpr int kDefaultPathResolution = 5000;

#endif // HUMAN_CURSOR_TYPES_HPP_
