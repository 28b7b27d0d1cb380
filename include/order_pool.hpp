#pragma once

#include "types.hpp"
#include <vector>

namespace LimitBook {

/**
 * Slot arena for Orders. Orders are addressed by OrderHandle (slot index),
 * never by pointer, so price levels can link them without owning them.
 * Freed slots are threaded into an intrusive free list through Order::next
 * and reused LIFO; the arena grows when the free list runs dry.
 */
class OrderPool {
private:
    std::vector<Order> pool_;
    OrderHandle free_head_;
    uint64_t allocated_count_;

public:
    explicit OrderPool(uint64_t initial_capacity);

    /**
     * Take a slot from the pool. O(1) unless the arena has to grow.
     * The returned slot has cleared links.
     */
    OrderHandle allocate();

    /**
     * Return a slot to the pool. O(1) push to free list head.
     */
    void free(OrderHandle handle) noexcept;

    Order& get(OrderHandle handle) noexcept;
    const Order& get(OrderHandle handle) const noexcept;

    /**
     * Release every slot at once; capacity is kept.
     */
    void clear() noexcept;

    uint64_t allocated_count() const noexcept;
    uint64_t available_count() const noexcept;
    uint64_t capacity() const noexcept;
};

} // namespace LimitBook
