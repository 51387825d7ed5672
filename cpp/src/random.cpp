#include "nb/random.h"
#include "nb/errors.h"

namespace nb {

Rng::Rng() {
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    gen_.seed(seq);
}

Rng::Rng(uint64_t seed) : gen_(seed) {}

uint64_t Rng::next_u64() {
    std::uniform_int_distribution<uint64_t> dis;
    return dis(gen_);
}

size_t Rng::index(size_t n) {
    if (n == 0) throw NbException(ErrorCode::InvalidArgs, "Rng::index: empty range");
    std::uniform_int_distribution<size_t> dis(0, n - 1);
    return dis(gen_);
}

int Rng::range(int lo, int hi) {
    if (lo >= hi) throw NbException(ErrorCode::InvalidArgs, "Rng::range: lo >= hi");
    std::uniform_int_distribution<int> dis(lo, hi - 1);
    return dis(gen_);
}

bool Rng::ratio(uint32_t num, uint32_t den) {
    if (den == 0) throw NbException(ErrorCode::InvalidArgs, "Rng::ratio: den == 0");
    if (num >= den) return true;
    std::uniform_int_distribution<uint32_t> dis(0, den - 1);
    return dis(gen_) < num;
}

double Rng::normal(double mean, double stddev) {
    std::normal_distribution<double> dis(mean, stddev);
    return dis(gen_);
}

} // namespace nb
