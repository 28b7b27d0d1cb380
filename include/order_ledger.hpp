#pragma once

#include "types.hpp"
#include "order_pool.hpp"
#include <unordered_map>
#include <unordered_set>

namespace LimitBook {

/**
 * Owns every live order, keyed by identifier. The single source of truth for
 * order attributes and remaining quantity; price levels only hold handles.
 *
 * Identifiers released by a fill or a cancel stay reserved until clear(), so a
 * caller can never resurrect a settled order under the same name.
 */
class OrderLedger {
private:
    OrderPool pool_;
    std::unordered_map<OrderId, OrderHandle> live_;
    std::unordered_set<OrderId> retired_;

public:
    explicit OrderLedger(uint64_t initial_capacity = DEFAULT_ORDER_CAPACITY);

    /**
     * Store a new order. Returns INVALID_HANDLE when the identifier is live or
     * was used since the last clear() (DuplicateIdentifier).
     */
    OrderHandle insert(const Order& order);

    /**
     * Live order lookup. Returns INVALID_HANDLE for an unknown identifier.
     */
    OrderHandle find(const OrderId& order_id) const noexcept;

    Order& get(OrderHandle handle) noexcept;
    const Order& get(OrderHandle handle) const noexcept;

    /**
     * Drop a live order by identifier and reserve the identifier.
     * Returns false when the order is unknown (UnknownOrder).
     * The caller must already have unlinked it from its price level.
     */
    bool remove(const OrderId& order_id);

    /**
     * Decrement remaining quantity. Returns true when the order is now empty,
     * in which case the caller unlinks it from the ladder and then calls release().
     * Throws InvariantViolation if quantity is zero or exceeds the remainder.
     */
    bool fill(OrderHandle handle, Quantity quantity);

    /**
     * Drop a live order by handle and reserve its identifier.
     */
    void release(OrderHandle handle);

    /**
     * Reserve an identifier that never rested (fully filled on entry).
     */
    void retire(const OrderId& order_id);

    bool is_known(const OrderId& order_id) const noexcept;

    /**
     * Forget every live and retired order (Flush).
     */
    void clear() noexcept;

    OrderPool& pool() noexcept;
    const OrderPool& pool() const noexcept;

    uint64_t live_count() const noexcept;
    uint64_t retired_count() const noexcept;
};

} // namespace LimitBook
