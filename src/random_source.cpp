#include "HumanCursor/random_source.hpp"
#include <chrono>
#include <stdexcept>

RandomSource::RandomSource()
{
    random_generator_.seed(
        static_cast<std::uint32_t>(std::chrono::system_clock::now().time_since_epoch().count()));
}

RandomSource::RandomSource(std::uint32_t seed)
    : random_generator_(seed)
{
}

int RandomSource::uniform_int(int min_inclusive, int max_exclusive)
{
    if (min_inclusive >= max_exclusive) {
        throw std::invalid_argument("uniform_int requires min_inclusive < max_exclusive");
    }

    std::uniform_int_distribution<int> dist(min_inclusive, max_exclusive - 1);
    std::lock_guard<std::mutex> lock(mutex_);
    return dist(random_generator_);
}

RandomSource& RandomSource::shared()
{
    static RandomSource instance;
    return instance;
}
