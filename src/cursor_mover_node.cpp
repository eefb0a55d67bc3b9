/**
 * Cursor Mover Node
 *
 * Moves the system pointer to a target position along a human-like path:
 * 1. Reads the current pointer position
 * 2. Generates a randomized cubic Bezier path
 * 3. Spreads the path over the requested duration
 * 4. Replays the movements, or writes them to CSV in dry-run mode
 */

#include "rclcpp/rclcpp.hpp"
#include <chrono>
#include <cstdint>
#include <exception>
#include <fstream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>

#include "HumanCursor/types.hpp"
#include "HumanCursor/random_source.hpp"
#include "HumanCursor/path_generator.hpp"
#include "HumanCursor/movement_scheduler.hpp"
#include "HumanCursor/cursor_mover.hpp"
#include "HumanCursor/x11_cursor_device.hpp"

class CursorMoverNode : public rclcpp::Node
{
public:
    CursorMoverNode() : Node("cursor_mover")
    {
        // Target and duration have no defaults and must come from the YAML file
        this->declare_parameter<int>("target_x");
        this->declare_parameter<int>("target_y");
        this->declare_parameter<int>("duration_ms");

        this->declare_parameter<std::string>("display", "");
        this->declare_parameter<int>("curve_resolution", kDefaultPathResolution);
        this->declare_parameter<int>("min_displacement_percent", 15);
        this->declare_parameter<int>("max_displacement_percent", 30);
        this->declare_parameter<int>("displacement_padding", 50);
        this->declare_parameter<bool>("dry_run", false);
        this->declare_parameter<std::string>("movements_csv", "movements.csv");

        // Kept at full width until validated, a cast here would wrap large values
        target_x_ = this->get_parameter("target_x").as_int();
        target_y_ = this->get_parameter("target_y").as_int();
        duration_ms_ = this->get_parameter("duration_ms").as_int();
        display_ = this->get_parameter("display").as_string();
        dry_run_ = this->get_parameter("dry_run").as_bool();
        movements_csv_ = this->get_parameter("movements_csv").as_string();

        path_params_.resolution = this->get_int_parameter("curve_resolution");
        path_params_.min_displacement_percent = this->get_int_parameter("min_displacement_percent");
        path_params_.max_displacement_percent = this->get_int_parameter("max_displacement_percent");
        path_params_.displacement_padding = this->get_int_parameter("displacement_padding");

        RCLCPP_INFO(this->get_logger(), "===========================================");
        RCLCPP_INFO(this->get_logger(), "  Human Cursor Mover");
        RCLCPP_INFO(this->get_logger(), "===========================================");
        RCLCPP_INFO(this->get_logger(), "Target: (%lld, %lld)",
                    static_cast<long long>(target_x_), static_cast<long long>(target_y_));
        RCLCPP_INFO(this->get_logger(), "Duration: %lld ms", static_cast<long long>(duration_ms_));
        RCLCPP_INFO(this->get_logger(), "Curve resolution: %d points", path_params_.resolution);
        if (dry_run_) {
            RCLCPP_INFO(this->get_logger(), "Dry run, writing movements to %s", movements_csv_.c_str());
        }
    }

    // Perform the configured move, errors propagate to the caller
    void run()
    {
        // Bad requests fail before the display is opened
        CursorMover::validate_request(target_x_, target_y_, std::chrono::milliseconds(duration_ms_));

        const Point target{static_cast<int>(target_x_), static_cast<int>(target_y_)};
        const int duration_ms = static_cast<int>(duration_ms_);

        X11CursorDevice device(display_);
        CursorMover mover(device, RandomSource::shared(), path_params_);

        if (!dry_run_) {
            mover.move_cursor(target.x, target.y, std::chrono::milliseconds(duration_ms));
            RCLCPP_INFO(this->get_logger(), "Target reached!");
            return;
        }

        Point start = device.get_position();
        MovementScheduler movements = mover.generate_movements(start, target, duration_ms);

        RCLCPP_INFO(this->get_logger(), "Planned %zu movements from (%d, %d)",
                    movements.size(), start.x, start.y);
        save_movements_to_csv(movements, movements_csv_);
    }

private:
    // Integer parameter that must fit in int
    int get_int_parameter(const std::string& name)
    {
        const std::int64_t value = this->get_parameter(name).as_int();
        if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
            throw std::invalid_argument("Parameter '" + name + "' is out of range");
        }
        return static_cast<int>(value);
    }

    // Save one row per visited point, the delay is repeated for every point of a movement
    void save_movements_to_csv(MovementScheduler& movements, const std::string& filename)
    {
        std::ofstream file(filename);
        if (!file.is_open()) {
            RCLCPP_ERROR(this->get_logger(), "Failed to save: %s", filename.c_str());
            return;
        }

        file << "movement,delay_ms,x,y\n";
        std::size_t index = 0;
        while (movements.has_next()) {
            Movement movement = movements.next();
            for (const auto& point : movement.points) {
                file << index << "," << movement.delay.count() << ","
                     << point.x << "," << point.y << "\n";
            }
            ++index;
        }
        file.close();

        RCLCPP_INFO(this->get_logger(), "Saved: %s", filename.c_str());
    }

    std::int64_t target_x_;
    std::int64_t target_y_;
    std::int64_t duration_ms_;
    std::string display_;
    bool dry_run_;
    std::string movements_csv_;
    PathGenerator::PathGeneratorParams path_params_;
};

int main(int argc, char **argv)
{
    rclcpp::init(argc, argv);

    int status = 0;
    try {
        auto node = std::make_shared<CursorMoverNode>();
        node->run();
    } catch (const std::exception& e) {
        RCLCPP_FATAL(rclcpp::get_logger("cursor_mover"), "%s", e.what());
        status = 1;
    }

    rclcpp::shutdown();
    return status;
}
