#include "mcpipboy/clock.hpp"

namespace mcpipboy {

std::chrono::system_clock::time_point SystemClock::now() const {
    return std::chrono::system_clock::now();
}

int64_t RandomSource::uniform_int(int64_t lo, int64_t hi) {
    std::uniform_int_distribution<int64_t> dist(lo, hi);
    return dist(*this);
}

double RandomSource::uniform_real(double lo, double hi) {
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(*this);
}

bool RandomSource::coin() {
    return (next() & 1u) != 0;
}

void RandomSource::fill(uint8_t* out, size_t n) {
    size_t i = 0;
    while (i < n) {
        uint64_t word = next();
        for (int b = 0; b < 8 && i < n; ++b, ++i) {
            out[i] = static_cast<uint8_t>(word >> (8 * b));
        }
    }
}

Mt19937Random::Mt19937Random() {
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    engine_.seed(seq);
}

} // namespace mcpipboy
