// primes.hpp
// Sieve helper used to size hash tables and seed the table's hash noise.

#ifndef OSTREE_PRIMES_HPP
#define OSTREE_PRIMES_HPP

#include <cstdint>

// Largest prime strictly less than k. Throws std::invalid_argument if k <= 2.
std::uint64_t largest_prime(std::uint64_t k);

#endif // OSTREE_PRIMES_HPP
