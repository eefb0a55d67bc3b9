#define BOOST_TEST_MODULE cursor_mover_tests

#include "HumanCursor/cursor_device.hpp"
#include "HumanCursor/cursor_mover.hpp"
#include "HumanCursor/path_generator.hpp"
#include "HumanCursor/random_source.hpp"
#include "HumanCursor/types.hpp"

#include <boost/test/unit_test.hpp>

#include <chrono>
#include <limits>
#include <stdexcept>
#include <vector>

namespace {

// In-memory pointer that records every update and can be told to fail
class FakeCursorDevice : public CursorDevice {
public:
    explicit FakeCursorDevice(Point position) : position_(position) {}

    Point get_position() override {
        ++get_calls;
        if (fail_get) {
            throw CursorError("query refused");
        }
        return position_;
    }

    void set_position(const Point& point) override {
        if (fail_on_set >= 0 && static_cast<int>(visited.size()) == fail_on_set) {
            throw CursorError("update refused");
        }
        visited.push_back(point);
        position_ = point;
    }

    int get_calls = 0;
    bool fail_get = false;
    int fail_on_set = -1;
    std::vector<Point> visited;

private:
    Point position_;
};

}  // namespace

BOOST_AUTO_TEST_SUITE(request_validation_tests)

BOOST_AUTO_TEST_CASE(negative_coordinates_fail_before_device_access) {
    FakeCursorDevice device(Point{10, 10});
    RandomSource source(1);
    CursorMover mover(device, source);

    BOOST_CHECK_THROW(mover.move_cursor(-1, 5, std::chrono::milliseconds(10)), std::invalid_argument);
    BOOST_CHECK_THROW(mover.move_cursor(5, -1, std::chrono::milliseconds(10)), std::invalid_argument);
    BOOST_CHECK_EQUAL(device.get_calls, 0);
    BOOST_CHECK(device.visited.empty());
}

BOOST_AUTO_TEST_CASE(non_positive_duration_fails_before_device_access) {
    FakeCursorDevice device(Point{10, 10});
    RandomSource source(2);
    CursorMover mover(device, source);

    BOOST_CHECK_THROW(mover.move_cursor(5, 5, std::chrono::milliseconds(0)), std::invalid_argument);
    BOOST_CHECK_THROW(mover.move_cursor(5, 5, std::chrono::milliseconds(-20)), std::invalid_argument);
    BOOST_CHECK_EQUAL(device.get_calls, 0);
    BOOST_CHECK(device.visited.empty());
}

BOOST_AUTO_TEST_CASE(duration_beyond_int_range_is_rejected) {
    FakeCursorDevice device(Point{10, 10});
    RandomSource source(8);
    CursorMover mover(device, source);

    const std::chrono::milliseconds too_long(std::numeric_limits<int>::max() + 1LL);
    BOOST_CHECK_THROW(mover.move_cursor(5, 5, too_long), std::invalid_argument);
    BOOST_CHECK_EQUAL(device.get_calls, 0);
}

BOOST_AUTO_TEST_CASE(request_validation_accepts_valid_requests) {
    BOOST_CHECK_NO_THROW(CursorMover::validate_request(0, 0, std::chrono::milliseconds(1)));
    BOOST_CHECK_NO_THROW(CursorMover::validate_request(
        std::numeric_limits<int>::max(), 1080,
        std::chrono::milliseconds(std::numeric_limits<int>::max())));
}

BOOST_AUTO_TEST_CASE(request_validation_rejects_values_that_would_wrap_to_int) {
    // 4294967297 and 4294967301 truncate to 1 and 5 when cast to a 32-bit int
    BOOST_CHECK_THROW(CursorMover::validate_request(
        100, 100, std::chrono::milliseconds(4294967297LL)), std::invalid_argument);
    BOOST_CHECK_THROW(CursorMover::validate_request(
        4294967301LL, 100, std::chrono::milliseconds(50)), std::invalid_argument);
    BOOST_CHECK_THROW(CursorMover::validate_request(
        100, 4294967301LL, std::chrono::milliseconds(50)), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(request_validation_rejects_bad_requests) {
    BOOST_CHECK_THROW(CursorMover::validate_request(-1, 0, std::chrono::milliseconds(10)),
                      std::invalid_argument);
    BOOST_CHECK_THROW(CursorMover::validate_request(0, -1, std::chrono::milliseconds(10)),
                      std::invalid_argument);
    BOOST_CHECK_THROW(CursorMover::validate_request(0, 0, std::chrono::milliseconds(0)),
                      std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(playback_tests)

BOOST_AUTO_TEST_CASE(moves_from_current_position_to_target) {
    FakeCursorDevice device(Point{20, 30});
    RandomSource source(3);
    CursorMover mover(device, source);

    const auto started = std::chrono::steady_clock::now();
    mover.move_cursor(400, 250, std::chrono::milliseconds(40));
    const auto elapsed = std::chrono::steady_clock::now() - started;

    BOOST_CHECK_EQUAL(device.get_calls, 1);
    BOOST_REQUIRE_EQUAL(device.visited.size(), static_cast<std::size_t>(kDefaultPathResolution));
    BOOST_CHECK(device.visited.front() == (Point{20, 30}));
    BOOST_CHECK(device.visited.back() == (Point{400, 250}));
    BOOST_CHECK(elapsed >= std::chrono::milliseconds(40));
}

BOOST_AUTO_TEST_CASE(planning_does_not_touch_the_device) {
    FakeCursorDevice device(Point{0, 0});
    RandomSource source(4);
    CursorMover mover(device, source);

    MovementScheduler movements = mover.generate_movements(Point{0, 0}, Point{100, 0}, 2500);

    BOOST_CHECK_EQUAL(movements.size(), 2500u);
    BOOST_CHECK_EQUAL(device.get_calls, 0);
    BOOST_CHECK(device.visited.empty());
}

BOOST_AUTO_TEST_CASE(replay_visits_points_in_path_order) {
    FakeCursorDevice device(Point{0, 0});
    RandomSource source(5);
    PathGenerator::PathGeneratorParams params;
    params.resolution = 50;
    CursorMover mover(device, source, params);

    // Same seed, and the path is drawn before the scheduler shuffles
    RandomSource path_source(5);
    PathGenerator generator(path_source, params);
    const std::vector<Point> expected = generator.generate_path(Point{0, 100}, Point{0, 0});

    MovementScheduler movements = mover.generate_movements(Point{0, 100}, Point{0, 0}, 20);
    mover.replay(movements);

    BOOST_CHECK(!movements.has_next());
    BOOST_REQUIRE_EQUAL(device.visited.size(), 50u);
    BOOST_CHECK(device.visited == expected);
}

BOOST_AUTO_TEST_CASE(query_failure_propagates) {
    FakeCursorDevice device(Point{0, 0});
    device.fail_get = true;
    RandomSource source(6);
    CursorMover mover(device, source);

    BOOST_CHECK_THROW(mover.move_cursor(10, 10, std::chrono::milliseconds(10)), CursorError);
    BOOST_CHECK(device.visited.empty());
}

BOOST_AUTO_TEST_CASE(update_failure_aborts_playback) {
    FakeCursorDevice device(Point{0, 0});
    device.fail_on_set = 1200;
    RandomSource source(7);
    CursorMover mover(device, source);

    MovementScheduler movements = mover.generate_movements(Point{0, 0}, Point{300, 300}, 100);
    BOOST_CHECK_THROW(mover.replay(movements), CursorError);

    // 50 points per movement, so the failure lands in movement 24
    BOOST_CHECK_EQUAL(device.visited.size(), 1200u);
    BOOST_CHECK(movements.has_next());
}

BOOST_AUTO_TEST_SUITE_END()
