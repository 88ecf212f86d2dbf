#ifndef RANDOM_HPP
#define RANDOM_HPP

#include <glm/gtc/constants.hpp>
#include <cstdint>
#include <random>

// Seedable random source shared by every spawn decision of a game
class Random {
public:
    explicit Random(uint32_t seed = std::random_device{}())
        : seed(seed), engine(seed) {}

    uint32_t GetSeed() const { return seed; }

    // Uniform in [0, 1)
    float Next() {
        return std::uniform_real_distribution<float>(0.0f, 1.0f)(engine);
    }

    // Uniform in [min, max)
    float Range(float min, float max) {
        return min + Next() * (max - min);
    }

    // Uniform in [min, max]
    int RangeInt(int min, int max) {
        return std::uniform_int_distribution<int>(min, max)(engine);
    }

    float Angle() {
        return Next() * glm::two_pi<float>();
    }

    bool Chance(float probability) {
        return Next() < probability;
    }

private:
    uint32_t seed;
    std::mt19937 engine;
};

#endif // RANDOM_HPP
