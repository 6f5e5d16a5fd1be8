#include "random.hh"

#include <limits>
#include <mutex>
#include <random>

static std::mt19937 rng{std::random_device{}()};
static std::uniform_int_distribution<uint32_t> gen32_dist{
    1, std::numeric_limits<uint32_t>::max()};
static std::mutex rng_mutex;

uint32_t nalstream::random::generate_32() {
    std::lock_guard<std::mutex> lg(rng_mutex);
    return gen32_dist(rng);
}
