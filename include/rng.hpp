#pragma once
#include <random>
#include <cstdint>

struct RNG {
    std::mt19937 gen;

    explicit RNG(int seed) {
        if (seed < 0) { std::random_device rd; gen.seed(rd()); }
        else          { gen.seed(static_cast<uint32_t>(seed)); }
    }
    // entero uniforme en [a, b]
    inline int rbi(int a, int b) { return std::uniform_int_distribution<int>(a, b)(gen); }
};
