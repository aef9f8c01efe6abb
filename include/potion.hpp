// potion.hpp
// A potion as traded in the simulation, plus the string hashes used to place potions in a
// LinearProbeTable.

#ifndef OSTREE_POTION_HPP
#define OSTREE_POTION_HPP

#include <cstddef>
#include <string>

struct Potion {
    std::string type;
    std::string name;
    double buy_price;   // vendor price, $ per litre
    double quantity;    // litres

    static Potion create_empty(std::string type, std::string name, double buy_price);

    // Polynomial hash whose multiplier is itself perturbed after every character.
    // Requires table_size >= 2.
    static std::size_t good_hash(const std::string& name, std::size_t table_size);

    // First character only; collides heavily once the table outgrows the alphabet.
    static std::size_t bad_hash(const std::string& name, std::size_t table_size);
};

#endif // OSTREE_POTION_HPP
