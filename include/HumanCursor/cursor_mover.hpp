#ifndef CURSOR_MOVER_HPP_
#define CURSOR_MOVER_HPP_

#include <chrono>
#include "HumanCursor/cursor_device.hpp"
#include "HumanCursor/movement_scheduler.hpp"
#include "HumanCursor/path_generator.hpp"
#include "HumanCursor/random_source.hpp"
#include "HumanCursor/types.hpp"

/**
 * Moves the pointer along a generated human-like path in a given amount of time.
 * Combines the path generator, the movement scheduler and a cursor device.
 */
class CursorMover
{
public:
    CursorMover(CursorDevice& device,
                RandomSource& random_source,
                const PathGenerator::PathGeneratorParams& params = PathGenerator::PathGeneratorParams());

    /**
     * Move the pointer from its current position to (x, y).
     * Busy-waits between steps, so one core is fully used for the whole duration.
     *
     * @param x Target horizontal coordinate, must not be negative
     * @param y Target vertical coordinate, must not be negative
     * @param duration Total movement time, must be positive
     */
    void move_cursor(int x, int y, std::chrono::milliseconds duration);

    /**
     * Check a move request without touching any device.
     * Throws std::invalid_argument unless both coordinates fit in [0, INT_MAX]
     * and the duration fits in (0, INT_MAX] milliseconds.
     */
    static void validate_request(long long x, long long y, std::chrono::milliseconds duration);

    /**
     * Plan the movements between two points without touching the device.
     *
     * @param start Path start
     * @param end Path end
     * @param milliseconds Total duration, must be positive
     * @return One-shot producer of the movements
     */
    MovementScheduler generate_movements(const Point& start, const Point& end, int milliseconds);

    /**
     * Apply every remaining movement to the device.
     * The first device failure stops playback and propagates.
     */
    void replay(MovementScheduler& movements);

private:
    CursorDevice& device_;
    RandomSource& random_source_;
    PathGenerator path_generator_;
};

#endif // CURSOR_MOVER_HPP_
