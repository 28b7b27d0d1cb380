#include <gtest/gtest.h>
#include "price_level.hpp"
#include "order_pool.hpp"
#include "types.hpp"
#include <memory>
#include <vector>

using namespace LimitBook;

class PriceLevelTest : public ::testing::Test {
protected:
    void SetUp() override {
        pool = std::make_unique<OrderPool>(16);
        level = std::make_unique<PriceLevel>(5000);

        // Create test orders
        for (int i = 0; i < 3; ++i) {
            OrderHandle handle = pool->allocate();
            pool->get(handle) = Order("o" + std::to_string(i + 1), Side::BUY, 5000,
                                      static_cast<Quantity>((i + 1) * 100), static_cast<Sequence>(i + 1));
            handles.push_back(handle);
        }
    }

    void add_all() {
        for (OrderHandle handle : handles) {
            level->add_order(*pool, handle);
        }
    }

    std::unique_ptr<OrderPool> pool;
    std::unique_ptr<PriceLevel> level;
    std::vector<OrderHandle> handles;
};

TEST_F(PriceLevelTest, InitialState) {
    EXPECT_TRUE(level->empty());
    EXPECT_EQ(level->price, 5000);
    EXPECT_EQ(level->total_volume, 0u);
    EXPECT_EQ(level->order_count, 0u);
    EXPECT_EQ(level->head, INVALID_HANDLE);
    EXPECT_EQ(level->tail, INVALID_HANDLE);
}

TEST_F(PriceLevelTest, AddSingleOrder) {
    OrderHandle handle = handles[0];
    level->add_order(*pool, handle);

    EXPECT_FALSE(level->empty());
    EXPECT_EQ(level->total_volume, 100u);
    EXPECT_EQ(level->order_count, 1u);
    EXPECT_EQ(level->head, handle);
    EXPECT_EQ(level->tail, handle);
    EXPECT_EQ(pool->get(handle).next, INVALID_HANDLE);
    EXPECT_EQ(pool->get(handle).prev, INVALID_HANDLE);
}

TEST_F(PriceLevelTest, AddMultipleOrders) {
    add_all();

    EXPECT_EQ(level->total_volume, 600u); // 100 + 200 + 300
    EXPECT_EQ(level->order_count, 3u);

    // Check FIFO ordering
    EXPECT_EQ(level->front(), handles[0]);
    EXPECT_EQ(level->tail, handles[2]);

    // Check linked list structure
    EXPECT_EQ(pool->get(handles[0]).next, handles[1]);
    EXPECT_EQ(pool->get(handles[1]).prev, handles[0]);
    EXPECT_EQ(pool->get(handles[1]).next, handles[2]);
    EXPECT_EQ(pool->get(handles[2]).prev, handles[1]);
}

TEST_F(PriceLevelTest, RemoveMiddleOrder) {
    add_all();

    level->remove_order(*pool, handles[1]);

    EXPECT_EQ(level->total_volume, 400u); // 100 + 300
    EXPECT_EQ(level->order_count, 2u);
    EXPECT_EQ(pool->get(handles[0]).next, handles[2]);
    EXPECT_EQ(pool->get(handles[2]).prev, handles[0]);
}

TEST_F(PriceLevelTest, RemoveHeadOrder) {
    add_all();

    level->remove_order(*pool, handles[0]);

    EXPECT_EQ(level->total_volume, 500u); // 200 + 300
    EXPECT_EQ(level->front(), handles[1]);
    EXPECT_EQ(pool->get(handles[1]).prev, INVALID_HANDLE);
}

TEST_F(PriceLevelTest, RemoveTailOrder) {
    add_all();

    level->remove_order(*pool, handles[2]);

    EXPECT_EQ(level->total_volume, 300u); // 100 + 200
    EXPECT_EQ(level->tail, handles[1]);
    EXPECT_EQ(pool->get(handles[1]).next, INVALID_HANDLE);
}

TEST_F(PriceLevelTest, RemoveAllOrders) {
    add_all();

    level->remove_order(*pool, handles[1]);
    level->remove_order(*pool, handles[0]);
    level->remove_order(*pool, handles[2]);

    EXPECT_TRUE(level->empty());
    EXPECT_EQ(level->total_volume, 0u);
    EXPECT_EQ(level->order_count, 0u);
    EXPECT_EQ(level->head, INVALID_HANDLE);
    EXPECT_EQ(level->tail, INVALID_HANDLE);
}

TEST_F(PriceLevelTest, PartialFillReducesVolumeOnly) {
    add_all();

    pool->get(handles[0]).remaining_quantity -= 40;
    level->reduce_volume(40);

    EXPECT_EQ(level->total_volume, 560u);
    EXPECT_EQ(level->order_count, 3u);
    EXPECT_EQ(level->front(), handles[0]);

    // Removing the partially filled order subtracts only what it still holds
    level->remove_order(*pool, handles[0]);
    EXPECT_EQ(level->total_volume, 500u);
}

TEST_F(PriceLevelTest, ReAddedOrderGoesToBack) {
    add_all();

    level->remove_order(*pool, handles[0]);
    level->add_order(*pool, handles[0]);

    EXPECT_EQ(level->front(), handles[1]);
    EXPECT_EQ(level->tail, handles[0]);
    EXPECT_EQ(pool->get(handles[2]).next, handles[0]);
}
