#ifndef RANDOM_SOURCE_HPP_
#define RANDOM_SOURCE_HPP_

#include <cstdint>
#include <mutex>
#include <random>

/**
 * Pseudo-random integer source shared by the path generator and the scheduler.
 * Every draw is serialized, so one instance can be used from several threads.
 */
class RandomSource
{
public:
    // Seed from the system clock
    RandomSource();

    // Deterministic sequence for a given seed
    explicit RandomSource(std::uint32_t seed);

    /**
     * Draw a uniformly distributed integer.
     *
     * @param min_inclusive Smallest value that can be returned
     * @param max_exclusive One past the largest value that can be returned
     * @return Value in [min_inclusive, max_exclusive)
     */
    int uniform_int(int min_inclusive, int max_exclusive);

    // Process-wide instance, seeded once on first use
    static RandomSource& shared();

private:
    std::mt19937 random_generator_;
    std::mutex mutex_;
};

#endif // RANDOM_SOURCE_HPP_
