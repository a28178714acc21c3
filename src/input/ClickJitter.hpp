#pragma once

#include <cstdint>
#include <random>

namespace gamevision {

// Randomized pauses around a click. Seedable so tests can pin the sequence.
class ClickJitter {
public:
    static constexpr int kPreMinMs = 5;
    static constexpr int kPreMaxMs = 14;
    static constexpr int kPostMinMs = 3;
    static constexpr int kPostMaxMs = 9;

    ClickJitter() : rng_(std::random_device{}()) {}
    explicit ClickJitter(std::uint32_t seed) : rng_(seed) {}

    int preDelayMs() {
        return std::uniform_int_distribution<int>(kPreMinMs, kPreMaxMs)(rng_);
    }

    int postDelayMs() {
        return std::uniform_int_distribution<int>(kPostMinMs, kPostMaxMs)(rng_);
    }

private:
    std::mt19937 rng_;
};

}  // namespace gamevision
