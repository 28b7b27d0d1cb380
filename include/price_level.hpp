#pragma once

#include "types.hpp"
#include "order_pool.hpp"

namespace LimitBook {

/**
 * One price on one side of the book: a FIFO of resting orders, oldest at head.
 * The queue is an intrusive doubly linked list threaded through the orders'
 * next/prev handles, so any member can be unlinked in O(1).
 */
struct PriceLevel {
    Price price;
    uint64_t total_volume;
    uint32_t order_count;
    OrderHandle head;  // Oldest order, matched first
    OrderHandle tail;  // Newest order

    explicit PriceLevel(Price p = NO_PRICE) noexcept;

    void add_order(OrderPool& pool, OrderHandle handle) noexcept;
    void remove_order(OrderPool& pool, OrderHandle handle) noexcept;

    // Partial fill of a resting order at this level
    void reduce_volume(Quantity quantity) noexcept;

    OrderHandle front() const noexcept;
    bool empty() const noexcept;
};

} // namespace LimitBook
