#include "random_gen.hpp"

#include <array>
#include <stdexcept>

std::uint32_t RandomGen::randint(std::uint32_t k) {
    if (k < 1) throw std::invalid_argument("RandomGen::randint: upper bound must be at least 1");

    std::array<std::uint32_t, 5> draws;
    for (auto& d : draws) d = next() >> 16;

    std::uint32_t value = 0;
    for (int bit = 0; bit < 16; ++bit) {
        int votes = 0;
        for (auto d : draws) votes += (d >> bit) & 1u;
        if (votes >= 3) value |= (1u << bit);
    }
    return value % k + 1;
}
