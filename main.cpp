// Demo: one day of the potion trading simulation.
//
// Usage: ostree_demo [seed]
//   seed - unsigned 32-bit seed for the vendor picks (default 0)

#include <cstdint>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "potion_game.hpp"

int main(int argc, char** argv) {
    std::uint32_t seed = 0;
    if (argc > 1) {
        try {
            unsigned long parsed = std::stoul(argv[1]);
            if (parsed > 0xffffffffUL) throw std::out_of_range("seed exceeds 32 bits");
            seed = static_cast<std::uint32_t>(parsed);
        } catch (const std::exception& e) {
            std::cerr << "invalid seed '" << argv[1] << "': " << e.what() << "\n";
            return 1;
        }
    }

    try {
        Game game(seed);
        game.set_total_potion_data({
            { "Health", "Potion of Health Regeneration", 20 },
            { "Buff",   "Potion of Extreme Speed",       10 },
            { "Damage", "Potion of Deadly Poison",       45 },
            { "Health", "Potion of Instant Health",       5 },
            { "Buff",   "Potion of Increased Stamina",   25 },
            { "Damage", "Potion of Untenable Odour",      1 },
        });

        game.add_potions_to_inventory({
            { "Potion of Health Regeneration", 4 },
            { "Potion of Extreme Speed",       5 },
            { "Potion of Instant Health",      3 },
            { "Potion of Increased Stamina",  10 },
            { "Potion of Untenable Odour",     5 },
        });

        std::cout << "Inventory (keyed by buy price):\n";
        game.inventory().tree_dump(std::cout);

        std::cout << "\nVendors choose:\n";
        for (const auto& stock : game.choose_potions_for_vendors(4)) {
            std::cout << "  " << stock.first << " (" << stock.second << " L)\n";
        }

        std::vector<PotionValuation> valuations = {
            { "Potion of Health Regeneration", 30 },
            { "Potion of Extreme Speed",       15 },
            { "Potion of Instant Health",      15 },
            { "Potion of Increased Stamina",   20 },
        };
        std::vector<double> starting_money = { 12.5, 45, 80 };
        std::vector<double> results = game.solve_game(valuations, starting_money);

        std::cout << "\nBest outcome per starting amount:\n";
        for (size_t i = 0; i < results.size(); ++i) {
            std::cout << "  " << starting_money[i] << " -> " << results[i] << "\n";
        }

        std::string diag;
        if (!game.inventory().validate_invariants(&diag)) {
            std::cerr << diag;
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
