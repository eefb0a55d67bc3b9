#include "HumanCursor/path_generator.hpp"
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include "rclcpp/rclcpp.hpp"

PathGenerator::PathGenerator(RandomSource& random_source, const PathGeneratorParams& params)
    : random_source_(random_source),
      params_(params)
{
    if (params_.resolution < 2) {
        throw std::invalid_argument("Path resolution must include both endpoints");
    }
    if (params_.min_displacement_percent >= params_.max_displacement_percent) {
        throw std::invalid_argument("Control point displacement range is empty");
    }
    if (params_.displacement_padding < 0) {
        throw std::invalid_argument("Control point displacement padding must not be negative");
    }
}

// Generate a curved path from start to end through two randomized control points
std::vector<Point> PathGenerator::generate_path(const Point& start, const Point& end)
{
    std::vector<Point> path;
    path.reserve(params_.resolution);
    path.push_back(start);

    // Both control points bend towards the same side so the curve forms a single arc
    int arc_side = (random_source_.uniform_int(0, 2) == 0) ? -1 : 1;

    Point first_control = this->generate_control_point(start, end, arc_side);
    Point second_control = this->generate_control_point(start, end, arc_side);
    const Point anchors[4] = {start, first_control, second_control, end};

    RCLCPP_DEBUG(rclcpp::get_logger("path_generator"),
        "Arc side %+d, control points (%d, %d) and (%d, %d)",
        arc_side, first_control.x, first_control.y, second_control.x, second_control.y);

    // Interior samples start at t = 0, so the start point appears twice
    const int samples = params_.resolution - 2;
    for (int i = 0; i < samples; ++i)
    {
        double t = static_cast<double>(i) / static_cast<double>(samples);
        path.push_back(this->evaluate_bezier(anchors, t));
    }

    path.push_back(end);
    return path;
}

// Offset from start scaled by the axis delta plus padding, in whole percent steps
Point PathGenerator::generate_control_point(const Point& start, const Point& end, int arc_side)
{
    int x_percent = random_source_.uniform_int(
        params_.min_displacement_percent, params_.max_displacement_percent);
    int y_percent = random_source_.uniform_int(
        params_.min_displacement_percent, params_.max_displacement_percent);

    double x = start.x + arc_side *
        (std::abs(end.x - start.x) + params_.displacement_padding) * 0.01 * x_percent;
    double y = start.y + arc_side *
        (std::abs(end.y - start.y) + params_.displacement_padding) * 0.01 * y_percent;

    return Point{static_cast<int>(x), static_cast<int>(y)};
}

Point PathGenerator::max_displacement(const Point& start, const Point& end) const
{
    const int max_percent = params_.max_displacement_percent - 1;
    double x = (std::abs(end.x - start.x) + params_.displacement_padding) * 0.01 * max_percent;
    double y = (std::abs(end.y - start.y) + params_.displacement_padding) * 0.01 * max_percent;
    return Point{static_cast<int>(std::ceil(x)), static_cast<int>(std::ceil(y))};
}

// Bernstein form of the cubic Bezier curve, truncated to whole pixels
Point PathGenerator::evaluate_bezier(const Point (&anchors)[4], double t) const
{
    static const int binomial_coefficients[4] = {1, 3, 3, 1};

    double x = 0.0;
    double y = 0.0;
    for (int k = 0; k < 4; ++k)
    {
        double weight = binomial_coefficients[k] * std::pow(1.0 - t, 3 - k) * std::pow(t, k);
        x += anchors[k].x * weight;
        y += anchors[k].y * weight;
    }

    return Point{static_cast<int>(x), static_cast<int>(y)};
}
