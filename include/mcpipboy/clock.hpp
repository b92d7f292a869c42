#pragma once
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <limits>
#include <random>

namespace mcpipboy {

/// Source of the current time for tools that report or derive from "now".
class Clock {
public:
    virtual ~Clock() = default;
    [[nodiscard]] virtual std::chrono::system_clock::time_point now() const = 0;
};

class SystemClock : public Clock {
public:
    [[nodiscard]] std::chrono::system_clock::time_point now() const override;
};

class FixedClock : public Clock {
public:
    explicit FixedClock(std::chrono::system_clock::time_point t) : t_(t) {}
    [[nodiscard]] std::chrono::system_clock::time_point now() const override { return t_; }

private:
    std::chrono::system_clock::time_point t_;
};

/// Randomness for generating tools. Satisfies UniformRandomBitGenerator so it
/// can drive the <random> distributions directly.
class RandomSource {
public:
    using result_type = uint64_t;

    virtual ~RandomSource() = default;
    virtual uint64_t next() = 0;

    static constexpr result_type min() { return 0; }
    static constexpr result_type max() { return std::numeric_limits<result_type>::max(); }
    result_type operator()() { return next(); }

    /// Uniform in [lo, hi].
    int64_t uniform_int(int64_t lo, int64_t hi);
    /// Uniform in [lo, hi).
    double uniform_real(double lo, double hi);
    bool coin();
    void fill(uint8_t* out, size_t n);
};

class Mt19937Random : public RandomSource {
public:
    /// Seeded from std::random_device.
    Mt19937Random();
    explicit Mt19937Random(uint64_t seed) : engine_(seed) {}

    uint64_t next() override { return engine_(); }

private:
    std::mt19937_64 engine_;
};

} // namespace mcpipboy
