#include "HumanCursor/movement_scheduler.hpp"
#include <algorithm>
#include <cstddef>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <utility>
#include "rclcpp/rclcpp.hpp"

std::unordered_set<std::size_t> select_remainder_indices(
    std::size_t count,
    std::size_t how_many,
    RandomSource& random_source)
{
    // Swap partners are drawn as int
    if (count > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw std::invalid_argument("Too many indices to shuffle");
    }
    if (how_many > count) {
        throw std::invalid_argument("Cannot select more indices than are available");
    }

    std::unordered_set<std::size_t> selected;
    if (how_many == 0) {
        return selected;
    }

    std::vector<std::size_t> indices(count);
    std::iota(indices.begin(), indices.end(), 0);

    // Fisher-Yates from the back, the swap partner may be the element itself
    for (std::size_t i = count - 1; i > 0; --i)
    {
        std::size_t j = static_cast<std::size_t>(
            random_source.uniform_int(0, static_cast<int>(i) + 1));
        std::swap(indices[i], indices[j]);
    }

    selected.insert(indices.begin(), indices.begin() + static_cast<std::ptrdiff_t>(how_many));
    return selected;
}

MovementScheduler::MovementScheduler(
    std::vector<Point> path,
    int milliseconds,
    RandomSource& random_source)
    : path_(std::move(path)),
      regime_(POINTS_PER_STEP),
      movement_count_(0),
      base_share_(0),
      movement_index_(0),
      points_used_(0)
{
    if (path_.empty()) {
        throw std::invalid_argument("Cannot schedule movements for an empty path");
    }
    if (milliseconds <= 0) {
        throw std::invalid_argument("Movement duration must be positive");
    }

    const std::size_t point_count = path_.size();
    const std::size_t total_ms = static_cast<std::size_t>(milliseconds);
    std::size_t remainder = 0;

    if (total_ms <= point_count)
    {
        // Fewer time slots than points: 1 ms per movement, points spread across them
        regime_ = POINTS_PER_STEP;
        movement_count_ = total_ms;
        base_share_ = point_count / total_ms;
        remainder = point_count - total_ms * base_share_;
    }
    else
    {
        // More time slots than points: one point per movement, time spread across them
        regime_ = STEPS_PER_POINT;
        movement_count_ = point_count;
        base_share_ = total_ms / point_count;
        remainder = total_ms - point_count * base_share_;
    }

    bonus_indices_ = select_remainder_indices(movement_count_, remainder, random_source);

    RCLCPP_DEBUG(rclcpp::get_logger("movement_scheduler"),
        "%zu points over %d ms: %zu movements, base share %zu, %zu with one extra",
        point_count, milliseconds, movement_count_, base_share_, remainder);
}

bool MovementScheduler::has_next() const
{
    return movement_index_ < movement_count_;
}

Movement MovementScheduler::next()
{
    if (!this->has_next()) {
        throw std::out_of_range("All movements have already been produced");
    }

    const std::size_t share = base_share_ + (bonus_indices_.count(movement_index_) ? 1 : 0);

    Movement movement;
    if (regime_ == POINTS_PER_STEP)
    {
        auto first = path_.begin() + static_cast<std::ptrdiff_t>(points_used_);
        movement.delay = std::chrono::milliseconds(1);
        movement.points.assign(first, first + static_cast<std::ptrdiff_t>(share));
        points_used_ += share;
    }
    else
    {
        movement.delay = std::chrono::milliseconds(static_cast<long long>(share));
        movement.points.push_back(path_[points_used_]);
        points_used_ += 1;
    }

    ++movement_index_;
    return movement;
}

std::vector<Movement> schedule_movements(
    const std::vector<Point>& path,
    int milliseconds,
    RandomSource& random_source)
{
    MovementScheduler scheduler(path, milliseconds, random_source);

    std::vector<Movement> movements;
    movements.reserve(scheduler.size());
    while (scheduler.has_next()) {
        movements.push_back(scheduler.next());
    }
    return movements;
}
