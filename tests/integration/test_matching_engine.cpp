#include <gtest/gtest.h>
#include "matching_engine.hpp"
#include <limits>
#include <memory>
#include <vector>

using namespace LimitBook;

class MatchingEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine = std::make_unique<MatchingEngine>(64);
    }

    ExecutionResult submit(const std::string& id, Side side, Price price, Quantity quantity) {
        trades.clear();
        return engine->execute(Order(id, side, price, quantity, ++sequence), trades);
    }

    std::unique_ptr<MatchingEngine> engine;
    std::vector<TradeRecord> trades;
    Sequence sequence = 0;
};

TEST_F(MatchingEngineTest, SimpleOrderMatching) {
    // Add a buy order at price 5000
    ExecutionResult buy = submit("1", Side::BUY, 5000, 100);
    EXPECT_EQ(buy.filled_quantity, 0u);
    EXPECT_EQ(buy.resting_quantity, 100u);
    EXPECT_TRUE(trades.empty());

    // Add a sell order at price 4999 (should match at the resting 5000)
    ExecutionResult sell = submit("2", Side::SELL, 4999, 50);
    EXPECT_EQ(sell.filled_quantity, 50u);
    EXPECT_EQ(sell.resting_quantity, 0u);

    ASSERT_EQ(trades.size(), 1u);
    EXPECT_EQ(trades[0], (TradeRecord{"2", "1", 5000, 50}));

    EXPECT_EQ(engine->trades_executed(), 1u);
    EXPECT_EQ(engine->total_buy_quantity_matched(), engine->total_sell_quantity_matched());
    EXPECT_EQ(engine->book().best_bid(), 5000);
    EXPECT_EQ(engine->book().volume(Side::BUY), 50u);
}

TEST_F(MatchingEngineTest, PriceTimePriority) {
    // Two buy orders at the same price, then a better-priced one
    submit("1", Side::BUY, 5000, 100);
    submit("2", Side::BUY, 5000, 200);
    submit("3", Side::BUY, 5001, 10);

    // Sell order sweeps the better price first, then FIFO at 5000
    ExecutionResult sell = submit("4", Side::SELL, 5000, 150);
    EXPECT_EQ(sell.filled_quantity, 150u);

    ASSERT_EQ(trades.size(), 3u);
    EXPECT_EQ(trades[0], (TradeRecord{"4", "3", 5001, 10}));
    EXPECT_EQ(trades[1], (TradeRecord{"4", "1", 5000, 100}));
    EXPECT_EQ(trades[2], (TradeRecord{"4", "2", 5000, 40}));

    const PriceLevel* best = engine->book().best(Side::BUY);
    ASSERT_NE(best, nullptr);
    EXPECT_EQ(best->price, 5000);
    EXPECT_EQ(best->order_count, 1u);
    EXPECT_EQ(engine->ledger().get(best->front()).order_id, "2");
    EXPECT_EQ(engine->ledger().get(best->front()).remaining_quantity, 160u);
}

TEST_F(MatchingEngineTest, OrderCancellation) {
    submit("1", Side::BUY, 5000, 100);

    EXPECT_TRUE(engine->cancel("1"));
    EXPECT_FALSE(engine->cancel("1"));
    EXPECT_TRUE(engine->book().empty());
    EXPECT_EQ(engine->orders_cancelled(), 1u);

    // Nothing left to trade against
    ExecutionResult sell = submit("2", Side::SELL, 4000, 100);
    EXPECT_TRUE(trades.empty());
    EXPECT_EQ(sell.resting_quantity, 100u);
    EXPECT_EQ(engine->trades_executed(), 0u);
}

TEST_F(MatchingEngineTest, PartialFill) {
    // Large buy order
    submit("1", Side::BUY, 5000, 1000);

    // Smaller sell order
    ExecutionResult sell = submit("2", Side::SELL, 5000, 300);
    EXPECT_EQ(sell.filled_quantity, 300u);
    EXPECT_EQ(sell.resting_quantity, 0u);

    OrderHandle handle = engine->ledger().find("1");
    ASSERT_NE(handle, INVALID_HANDLE);
    EXPECT_EQ(engine->ledger().get(handle).remaining_quantity, 700u);
    EXPECT_EQ(engine->ledger().get(handle).original_quantity, 1000u);
    EXPECT_EQ(engine->book().volume(Side::BUY), 700u);

    // Sell order was filled on entry: never live, but its identifier is spent
    EXPECT_EQ(engine->ledger().find("2"), INVALID_HANDLE);
    EXPECT_TRUE(engine->is_known("2"));
}

TEST_F(MatchingEngineTest, NoMatchDifferentPrices) {
    // Buy order at lower price
    submit("1", Side::BUY, 4990, 100);

    // Sell order at higher price
    submit("2", Side::SELL, 5010, 100);

    // No match should occur
    EXPECT_EQ(engine->trades_executed(), 0u);
    EXPECT_EQ(engine->book().best_bid(), 4990);
    EXPECT_EQ(engine->book().best_ask(), 5010);
    EXPECT_FALSE(engine->book().is_crossed());
}

TEST_F(MatchingEngineTest, SweepsSeveralLevelsAndRestsRemainder) {
    submit("a1", Side::SELL, 101, 5);
    submit("a2", Side::SELL, 102, 5);
    submit("a3", Side::SELL, 104, 5);

    ExecutionResult buy = submit("b1", Side::BUY, 103, 20);

    EXPECT_EQ(buy.filled_quantity, 10u);
    EXPECT_EQ(buy.resting_quantity, 10u);
    ASSERT_EQ(trades.size(), 2u);
    EXPECT_EQ(trades[0].price, 101);
    EXPECT_EQ(trades[1].price, 102);

    // Remainder rests at its own limit, below the remaining ask
    EXPECT_EQ(engine->book().best_bid(), 103);
    EXPECT_EQ(engine->book().best_ask(), 104);
    EXPECT_EQ(engine->book().level_count(Side::SELL), 1u);
}

TEST_F(MatchingEngineTest, FullyFilledMakersLeaveLedger) {
    submit("a1", Side::SELL, 100, 5);
    submit("a2", Side::SELL, 100, 5);

    submit("b1", Side::BUY, 100, 10);

    EXPECT_EQ(engine->ledger().live_count(), 0u);
    EXPECT_EQ(engine->ledger().pool().allocated_count(), 0u);
    EXPECT_TRUE(engine->book().empty());
    EXPECT_TRUE(engine->is_known("a1"));
    EXPECT_TRUE(engine->is_known("a2"));
}

TEST_F(MatchingEngineTest, SelfTradesAreAllowed) {
    submit("x", Side::BUY, 100, 5);
    submit("y", Side::SELL, 100, 5);

    ASSERT_EQ(trades.size(), 1u);
    EXPECT_EQ(trades[0], (TradeRecord{"y", "x", 100, 5}));
}

TEST_F(MatchingEngineTest, FlushEmptiesEverything) {
    submit("1", Side::BUY, 100, 5);
    submit("2", Side::SELL, 110, 5);
    submit("3", Side::SELL, 100, 5);

    engine->flush();

    EXPECT_TRUE(engine->book().empty());
    EXPECT_EQ(engine->ledger().live_count(), 0u);
    EXPECT_FALSE(engine->is_known("1"));
    EXPECT_FALSE(engine->is_known("3"));
    EXPECT_EQ(engine->flushes(), 1u);
}

TEST_F(MatchingEngineTest, ResubmittingKnownIdentifierIsLogicFault) {
    submit("1", Side::BUY, 100, 5);

    EXPECT_THROW(submit("1", Side::BUY, 100, 5), InvariantViolation);
}

TEST(MatchCountersTest, SaturateInsteadOfWrapping) {
    const uint64_t max = std::numeric_limits<uint64_t>::max();

    EXPECT_EQ(saturating_add(4, 6), 10u);
    EXPECT_EQ(saturating_add(max - 1, 1), max);
    EXPECT_EQ(saturating_add(max, 4), max);
    EXPECT_EQ(saturating_add(max - 3, max), max);
}
