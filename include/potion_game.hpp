// potion_game.hpp
// Trading simulation driven by the order-statistics tree.
//
// PotionCorp keeps its stock in an AVLOrderStatMap keyed by vendor buy price. Vendors pick stock by
// random rank (kth_largest), and the best trading plan for a day is found by walking a second tree,
// keyed by profit per dollar spent, from the largest key down.

#ifndef OSTREE_POTION_GAME_HPP
#define OSTREE_POTION_GAME_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "avl_order_stat_map.hpp"
#include "linear_probe_table.hpp"
#include "potion.hpp"
#include "random_gen.hpp"

// One row of the potion catalogue.
struct PotionData {
    std::string type;
    std::string name;
    double buy_price;
};

// (potion name, litres)
using PotionStock = std::pair<std::string, double>;

// (potion name, price adventurers pay per litre)
using PotionValuation = std::pair<std::string, double>;

struct Trade {
    double profit_per_dollar;
    double max_spend;   // money needed to buy out the stock
};

class Game {
public:
    using Inventory = AVLOrderStatMap<double, PotionStock>;
    using TradeBook = AVLOrderStatMap<double, Trade>;

    explicit Game(std::uint32_t seed = 0);

    // Replaces the catalogue. Throws std::invalid_argument for a non-positive buy price.
    void set_total_potion_data(const std::vector<PotionData>& rows);

    // Throws key_not_found for a potion missing from the catalogue and duplicate_key when two
    // stocked potions share a buy price. The batch is all or nothing.
    void add_potions_to_inventory(const std::vector<PotionStock>& stock);

    // Each vendor takes the kth-largest-priced stock for a random k; the picks are put back into the
    // inventory once every vendor has chosen. Throws std::invalid_argument if there are more vendors
    // than stocked potions.
    std::vector<PotionStock> choose_potions_for_vendors(std::size_t num_vendors);

    // Best achievable end-of-day money for each starting amount.
    std::vector<double> solve_game(const std::vector<PotionValuation>& valuations,
                                   const std::vector<double>& starting_money) const;

    const Inventory& inventory() const noexcept { return inventory_; }
    const LinearProbeTable<Potion>& potion_table() const noexcept { return potion_table_; }

private:
    RandomGen rand_;
    LinearProbeTable<Potion> potion_table_;
    Inventory inventory_;

    TradeBook build_trade_book(const std::vector<PotionValuation>& valuations) const;
};

#endif // OSTREE_POTION_GAME_HPP
