#include "potion.hpp"
#include "primes.hpp"

#include <cstdint>
#include <stdexcept>
#include <utility>

Potion Potion::create_empty(std::string type, std::string name, double buy_price) {
    return Potion{ std::move(type), std::move(name), buy_price, 0.0 };
}

std::size_t Potion::good_hash(const std::string& name, std::size_t table_size) {
    if (table_size < 2) throw std::invalid_argument("Potion::good_hash: table size must be at least 2");

    static const std::uint64_t initial_noise = largest_prime(1000);
    static const std::uint64_t hash_base = largest_prime(5000);

    std::uint64_t value = 0;
    std::uint64_t noise = initial_noise;
    for (char c : name) {
        value = (static_cast<unsigned char>(c) + value * noise) % table_size;
        noise = (noise * hash_base) % (table_size - 1);
    }
    return static_cast<std::size_t>(value);
}

std::size_t Potion::bad_hash(const std::string& name, std::size_t table_size) {
    if (table_size == 0) throw std::invalid_argument("Potion::bad_hash: table size must be positive");
    if (name.empty()) return 0;
    return static_cast<unsigned char>(name[0]) % table_size;
}
