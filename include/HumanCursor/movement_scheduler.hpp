#ifndef MOVEMENT_SCHEDULER_HPP_
#define MOVEMENT_SCHEDULER_HPP_

#include <cstddef>
#include <unordered_set>
#include <vector>
#include "HumanCursor/random_source.hpp"
#include "HumanCursor/types.hpp"

/**
 * Pick which steps receive the leftover share of a division.
 * Shuffles [0, count) with Fisher-Yates and keeps the first how_many indices.
 *
 * @param count Number of candidate indices, at most INT_MAX
 * @param how_many Number of indices to select, at most count
 * @param random_source Source for the shuffle
 * @return Selected indices
 */
std::unordered_set<std::size_t> select_remainder_indices(
    std::size_t count,
    std::size_t how_many,
    RandomSource& random_source);

/**
 * Splits a waypoint path and a total duration into replay steps.
 * One-shot producer: movements are built on demand by next() and cannot be replayed.
 *
 * When the duration is at most the path length every step lasts 1 ms and carries
 * several points. Otherwise every step carries one point and the delay is spread.
 * Delays always sum to the duration and the points concatenate back to the path.
 */
class MovementScheduler
{
public:
    enum Regime {
        POINTS_PER_STEP,  // milliseconds <= path size
        STEPS_PER_POINT   // milliseconds > path size
    };

    MovementScheduler(std::vector<Point> path, int milliseconds, RandomSource& random_source);

    bool has_next() const;

    /**
     * Produce the next movement in path order.
     * Throws std::out_of_range once every movement has been produced.
     */
    Movement next();

    // Total number of movements this scheduler produces
    std::size_t size() const { return movement_count_; }

    Regime regime() const { return regime_; }

private:
    std::vector<Point> path_;
    Regime regime_;
    std::size_t movement_count_;
    std::size_t base_share_;    // Points (or milliseconds) every movement gets
    std::unordered_set<std::size_t> bonus_indices_;  // Movements with one extra

    std::size_t movement_index_;
    std::size_t points_used_;
};

// Drain a scheduler for the given path into a vector
std::vector<Movement> schedule_movements(
    const std::vector<Point>& path,
    int milliseconds,
    RandomSource& random_source);

#endif // MOVEMENT_SCHEDULER_HPP_
