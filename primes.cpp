// Sieve of Eratosthenes over [0, k).

#include "primes.hpp"

#include <stdexcept>
#include <vector>

std::uint64_t largest_prime(std::uint64_t k) {
    if (k <= 2) throw std::invalid_argument("largest_prime: k must be greater than 2");

    std::vector<bool> is_prime(k, true);
    is_prime[0] = false;
    is_prime[1] = false;
    for (std::uint64_t i = 2; i * i < k; ++i) {
        if (!is_prime[i]) continue;
        for (std::uint64_t j = i * i; j < k; j += i) is_prime[j] = false;
    }

    std::uint64_t i = k - 1;
    while (!is_prime[i]) --i;
    return i;
}
