#include "HumanCursor/cursor_mover.hpp"
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>
#include "rclcpp/rclcpp.hpp"

CursorMover::CursorMover(
    CursorDevice& device,
    RandomSource& random_source,
    const PathGenerator::PathGeneratorParams& params)
    : device_(device),
      random_source_(random_source),
      path_generator_(random_source, params)
{
}

void CursorMover::validate_request(long long x, long long y, std::chrono::milliseconds duration)
{
    const long long max_value = std::numeric_limits<int>::max();

    if (x < 0 || y < 0 || x > max_value || y > max_value) {
        throw std::invalid_argument("The provided coordinates were invalid");
    }
    if (duration.count() <= 0 || duration.count() > max_value) {
        throw std::invalid_argument("The provided duration was invalid");
    }
}

void CursorMover::move_cursor(int x, int y, std::chrono::milliseconds duration)
{
    // Reject bad requests before touching the device
    validate_request(x, y, duration);

    Point start = device_.get_position();
    Point target{x, y};

    RCLCPP_INFO(rclcpp::get_logger("cursor_mover"),
        "Moving cursor (%d, %d) -> (%d, %d) over %lld ms",
        start.x, start.y, target.x, target.y, static_cast<long long>(duration.count()));

    MovementScheduler movements = this->generate_movements(
        start, target, static_cast<int>(duration.count()));
    this->replay(movements);
}

MovementScheduler CursorMover::generate_movements(const Point& start, const Point& end, int milliseconds)
{
    std::vector<Point> path = path_generator_.generate_path(start, end);
    return MovementScheduler(std::move(path), milliseconds, random_source_);
}

// Visit each movement's points, then spin until its delay has passed
void CursorMover::replay(MovementScheduler& movements)
{
    using Clock = std::chrono::steady_clock;

    std::size_t replayed = 0;
    Clock::time_point step_start = Clock::now();

    while (movements.has_next())
    {
        Movement movement = movements.next();

        try {
            for (const Point& point : movement.points) {
                device_.set_position(point);
            }
        } catch (const CursorError& e) {
            RCLCPP_ERROR(rclcpp::get_logger("cursor_mover"),
                "Playback aborted after %zu of %zu movements: %s",
                replayed, movements.size(), e.what());
            throw;
        }

        while (Clock::now() - step_start < movement.delay) {
            // Busy-wait, sleeping is too coarse for 1 ms steps
        }

        step_start = Clock::now();
        ++replayed;
    }

    RCLCPP_DEBUG(rclcpp::get_logger("cursor_mover"), "Replayed %zu movements", replayed);
}
