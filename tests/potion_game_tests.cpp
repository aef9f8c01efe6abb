// Unit tests for the potion trading simulation using GoogleTest
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

#include "potion_game.hpp"

namespace {

std::vector<PotionData> catalogue() {
    return {
        { "Health", "Potion of Health Regeneration", 20 },
        { "Buff",   "Potion of Extreme Speed",       10 },
        { "Damage", "Potion of Deadly Poison",       45 },
        { "Health", "Potion of Instant Health",       5 },
        { "Buff",   "Potion of Increased Stamina",   25 },
        { "Damage", "Potion of Untenable Odour",      1 },
    };
}

std::vector<PotionStock> day_one_stock() {
    return {
        { "Potion of Health Regeneration", 4 },
        { "Potion of Extreme Speed",       5 },
        { "Potion of Instant Health",      3 },
        { "Potion of Increased Stamina",  10 },
        { "Potion of Untenable Odour",     5 },
    };
}

std::vector<PotionValuation> adventurer_prices() {
    return {
        { "Potion of Health Regeneration", 30 },
        { "Potion of Extreme Speed",       15 },
        { "Potion of Instant Health",      15 },
        { "Potion of Increased Stamina",   20 },
    };
}

} // namespace

TEST(Game, CatalogueLookup) {
    Game g;
    g.set_total_potion_data(catalogue());
    const auto& table = g.potion_table();
    EXPECT_EQ(table.size(), 6u);
    EXPECT_EQ(table.at("Potion of Deadly Poison").buy_price, 45);
    EXPECT_EQ(table.at("Potion of Deadly Poison").type, "Damage");
    EXPECT_EQ(table.at("Potion of Deadly Poison").quantity, 0);
    EXPECT_THROW(table.at("Potion of Nothing"), key_not_found);
}

TEST(Game, RejectsNonPositivePrice) {
    Game g;
    EXPECT_THROW(g.set_total_potion_data({ { "Buff", "Free Potion", 0 } }), std::invalid_argument);
}

TEST(Game, InventoryKeyedByBuyPrice) {
    Game g;
    g.set_total_potion_data(catalogue());
    g.add_potions_to_inventory(day_one_stock());

    const auto& inv = g.inventory();
    EXPECT_EQ(inv.size(), 5u);
    EXPECT_EQ(inv.kth_largest(1).second.first, "Potion of Increased Stamina");
    EXPECT_EQ(inv.kth_largest(5).second.first, "Potion of Untenable Odour");
    EXPECT_EQ(inv.at(5.0).second, 3);

    EXPECT_THROW(g.add_potions_to_inventory({ { "Potion of Extreme Speed", 1 } }), duplicate_key);
    EXPECT_THROW(g.add_potions_to_inventory({ { "Potion of Nothing", 1 } }), key_not_found);
    EXPECT_EQ(inv.size(), 5u);
}

TEST(Game, RejectedBatchLeavesInventoryUnchanged) {
    Game g;
    g.set_total_potion_data(catalogue());
    g.add_potions_to_inventory({ { "Potion of Extreme Speed", 5 } });

    // first item is new, second collides on price with the stocked Extreme Speed
    EXPECT_THROW(g.add_potions_to_inventory({ { "Potion of Instant Health", 3 },
                                              { "Potion of Extreme Speed", 2 } }),
                 duplicate_key);
    EXPECT_EQ(g.inventory().size(), 1u);
    EXPECT_FALSE(g.inventory().contains(5.0));
    EXPECT_EQ(g.inventory().at(10.0).second, 5.0);

    // same-batch collision and an unknown name later in the batch
    EXPECT_THROW(g.add_potions_to_inventory({ { "Potion of Instant Health", 3 },
                                              { "Potion of Instant Health", 4 } }),
                 duplicate_key);
    EXPECT_THROW(g.add_potions_to_inventory({ { "Potion of Instant Health", 3 },
                                              { "Potion of Nothing", 1 } }),
                 key_not_found);
    EXPECT_EQ(g.inventory().size(), 1u);

    g.add_potions_to_inventory({ { "Potion of Instant Health", 3 } });
    EXPECT_EQ(g.inventory().size(), 2u);
}

TEST(Game, VendorsChooseByRandomRank) {
    Game g(0);
    g.set_total_potion_data(catalogue());
    g.add_potions_to_inventory(day_one_stock());

    std::vector<PotionStock> chosen = g.choose_potions_for_vendors(4);
    std::vector<PotionStock> expected = {
        { "Potion of Health Regeneration", 4 },
        { "Potion of Extreme Speed",       5 },
        { "Potion of Instant Health",      3 },
        { "Potion of Untenable Odour",     5 },
    };
    EXPECT_EQ(chosen, expected);

    // picks go back on the shelf
    EXPECT_EQ(g.inventory().size(), 5u);
    std::string diag;
    EXPECT_TRUE(g.inventory().validate_invariants(&diag)) << diag;
}

TEST(Game, EveryVendorCanChoose) {
    Game g(3);
    g.set_total_potion_data(catalogue());
    g.add_potions_to_inventory(day_one_stock());

    std::vector<PotionStock> chosen = g.choose_potions_for_vendors(5);
    std::vector<PotionStock> expected = {
        { "Potion of Health Regeneration", 4 },
        { "Potion of Instant Health",      3 },
        { "Potion of Untenable Odour",     5 },
        { "Potion of Extreme Speed",       5 },
        { "Potion of Increased Stamina",  10 },
    };
    EXPECT_EQ(chosen, expected);
    EXPECT_THROW(g.choose_potions_for_vendors(6), std::invalid_argument);
}

TEST(Game, SolveGameGreedyOverProfitPerDollar) {
    Game g;
    g.set_total_potion_data(catalogue());
    g.add_potions_to_inventory(day_one_stock());
    g.choose_potions_for_vendors(4);

    std::vector<double> results = g.solve_game(adventurer_prices(), { 12.5, 45, 80 });
    ASSERT_EQ(results.size(), 3u);
    EXPECT_DOUBLE_EQ(results[0], 37.5);
    EXPECT_DOUBLE_EQ(results[1], 90);
    EXPECT_DOUBLE_EQ(results[2], 142.5);
}

TEST(Game, SolveGameSkipsLosingTrades) {
    Game g;
    g.set_total_potion_data(catalogue());
    g.add_potions_to_inventory(day_one_stock());

    // every profitable trade is bought out; the loss-making one is left alone
    std::vector<double> results = g.solve_game(adventurer_prices(), { 200, 0 });
    ASSERT_EQ(results.size(), 2u);
    EXPECT_DOUBLE_EQ(results[0], 295);
    EXPECT_DOUBLE_EQ(results[1], 0);
}

TEST(Game, SolveGameRequiresStockedPotions) {
    Game g;
    g.set_total_potion_data(catalogue());
    g.add_potions_to_inventory(day_one_stock());
    EXPECT_THROW(g.solve_game({ { "Potion of Deadly Poison", 60 } }, { 10 }), key_not_found);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
