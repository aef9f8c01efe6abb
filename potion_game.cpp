#include "potion_game.hpp"

#include <stdexcept>
#include <utility>

Game::Game(std::uint32_t seed)
    : rand_(seed), potion_table_(100), inventory_() {}

void Game::set_total_potion_data(const std::vector<PotionData>& rows) {
    LinearProbeTable<Potion> table(rows.size());
    for (const auto& row : rows) {
        if (!(row.buy_price > 0.0))
            throw std::invalid_argument("Game::set_total_potion_data: buy price must be positive for " + row.name);
        table.insert(row.name, Potion::create_empty(row.type, row.name, row.buy_price));
    }
    potion_table_ = std::move(table);
}

void Game::add_potions_to_inventory(const std::vector<PotionStock>& stock) {
    // stage on a copy so a rejected item leaves the inventory untouched
    Inventory staged(inventory_);
    for (const auto& item : stock) {
        double price = potion_table_.at(item.first).buy_price;
        staged.insert(price, item);
    }
    inventory_ = std::move(staged);
}

std::vector<PotionStock> Game::choose_potions_for_vendors(std::size_t num_vendors) {
    if (num_vendors > inventory_.size())
        throw std::invalid_argument("Game::choose_potions_for_vendors: more vendors than stocked potions");

    std::vector<PotionStock> chosen;
    chosen.reserve(num_vendors);
    for (std::size_t i = 0; i < num_vendors; ++i) {
        std::uint32_t k = rand_.randint(static_cast<std::uint32_t>(inventory_.size()));
        const auto& picked = inventory_.kth_largest(k);
        double price = picked.first;
        chosen.push_back(picked.second);
        inventory_.erase(price);
    }

    add_potions_to_inventory(chosen);
    return chosen;
}

Game::TradeBook Game::build_trade_book(const std::vector<PotionValuation>& valuations) const {
    TradeBook book;
    for (const auto& valuation : valuations) {
        double buy_price = potion_table_.at(valuation.first).buy_price;
        double litres = inventory_.at(buy_price).second;
        double profit_per_dollar = (valuation.second - buy_price) / buy_price;
        double max_spend = litres * buy_price;

        // keys must be unique: trades with the same return are interchangeable, so pool them
        if (book.contains(profit_per_dollar)) book.at(profit_per_dollar).max_spend += max_spend;
        else book.insert(profit_per_dollar, Trade{ profit_per_dollar, max_spend });
    }
    return book;
}

std::vector<double> Game::solve_game(const std::vector<PotionValuation>& valuations,
                                     const std::vector<double>& starting_money) const {
    TradeBook book = build_trade_book(valuations);

    std::vector<double> results;
    results.reserve(starting_money.size());
    for (double money : starting_money) {
        double earnings = money;
        for (std::size_t k = 1; k <= book.size(); ++k) {
            const Trade& trade = book.kth_largest(k).second;
            if (trade.profit_per_dollar <= 0.0) break;
            if (money <= trade.max_spend) {
                earnings += money * trade.profit_per_dollar;
                break;
            }
            earnings += trade.profit_per_dollar * trade.max_spend;
            money -= trade.max_spend;
        }
        results.push_back(earnings);
    }
    return results;
}
