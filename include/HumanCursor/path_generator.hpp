#ifndef PATH_GENERATOR_HPP_
#define PATH_GENERATOR_HPP_

#include <vector>
#include "HumanCursor/random_source.hpp"
#include "HumanCursor/types.hpp"

/**
 * Cubic Bezier path generation with randomized curvature.
 * Produces a dense waypoint sequence that arcs to one side like a hand-driven pointer.
 */
class PathGenerator
{
public:
    /**
     * Curve shape configuration.
     */
    struct PathGeneratorParams
    {
        int resolution;                 // Waypoints per path, endpoints included
        int min_displacement_percent;   // Smallest control point offset (inclusive)
        int max_displacement_percent;   // Largest control point offset (exclusive)
        int displacement_padding;       // Pixels added to the axis delta before scaling

        PathGeneratorParams()
            : resolution(kDefaultPathResolution),
              min_displacement_percent(15),
              max_displacement_percent(30),
              displacement_padding(50)
        {}
    };

    PathGenerator(RandomSource& random_source,
                  const PathGeneratorParams& params = PathGeneratorParams());

    /**
     * Generate a curved path between two points.
     *
     * @param start First waypoint, usually the current pointer position
     * @param end Last waypoint
     * @return Exactly params.resolution points, first == start and last == end
     */
    std::vector<Point> generate_path(const Point& start, const Point& end);

    /**
     * Largest control point displacement the generator can produce on each axis.
     * Every waypoint lies within the start/end bounding box grown by this amount.
     */
    Point max_displacement(const Point& start, const Point& end) const;

    const PathGeneratorParams& params() const { return params_; }

private:
    // Randomized control point offset from start, arc_side is +1 or -1
    Point generate_control_point(const Point& start, const Point& end, int arc_side);

    // Evaluate the cubic Bezier curve at parameter t
    Point evaluate_bezier(const Point (&anchors)[4], double t) const;

    RandomSource& random_source_;
    PathGeneratorParams params_;
};

#endif // PATH_GENERATOR_HPP_
