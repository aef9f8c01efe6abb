// random_gen.hpp
// Deterministic pseudo-random integers for picking order-statistics queries.
//
// The underlying stream is a 32-bit linear congruential generator
//     seed' = (134775813 * seed + 1) mod 2^32
// randint(k) draws five outputs, keeps their top 16 bits and builds a 16-bit value by majority
// vote on each bit position, then maps it onto [1, k].
//
// One instance should live as long as its caller; re-creating it restarts the sequence.

#ifndef OSTREE_RANDOM_GEN_HPP
#define OSTREE_RANDOM_GEN_HPP

#include <cstdint>

class RandomGen {
public:
    static constexpr std::uint32_t multiplier = 134775813u;
    static constexpr std::uint32_t increment = 1u;

    explicit RandomGen(std::uint32_t seed = 0) noexcept : state_(seed) {}

    // Uniform-ish value in [1, k]. Throws std::invalid_argument if k < 1.
    std::uint32_t randint(std::uint32_t k);

    // Next raw LCG output.
    std::uint32_t next() noexcept {
        state_ = multiplier * state_ + increment; // wraps mod 2^32
        return state_;
    }

private:
    std::uint32_t state_;
};

#endif // OSTREE_RANDOM_GEN_HPP
