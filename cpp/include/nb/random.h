// cpp/include/nb/random.h
#pragma once
#include <cstddef>
#include <cstdint>
#include <random>

namespace nb {

// Single PRNG shared by one book run. Default-constructed instances are
// seeded from std::random_device; pass a seed for reproducible output.
class Rng {
public:
    Rng();
    explicit Rng(uint64_t seed);

    uint64_t next_u64();

    // uniform in [0, n), n > 0
    size_t index(size_t n);

    // uniform in [lo, hi), lo < hi
    int range(int lo, int hi);

    // true with probability num/den
    bool ratio(uint32_t num, uint32_t den);

    double normal(double mean, double stddev);

private:
    std::mt19937_64 gen_;
};

} // namespace nb
