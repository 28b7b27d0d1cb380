#pragma once

#include "types.hpp"
#include "order_pool.hpp"
#include "price_level.hpp"
#include <functional>
#include <map>

namespace LimitBook {

/**
 * Price level ladder for both sides of one instrument.
 *
 * Bids are kept in descending price order and asks in ascending order, so the
 * first level of either map is the best price for that side. Levels are created
 * when the first order rests at a price and erased as soon as they empty.
 * Orders live in the ledger's arena; the ladder only links their handles.
 */
class Book {
private:
    using BidLadder = std::map<Price, PriceLevel, std::greater<Price>>;
    using AskLadder = std::map<Price, PriceLevel, std::less<Price>>;

    OrderPool& pool_;
    BidLadder bid_levels_;
    AskLadder ask_levels_;

    template <typename Ladder>
    OrderHandle pop_front_from(Ladder& ladder, Price price);

    template <typename Ladder>
    void remove_from(Ladder& ladder, OrderHandle handle);

public:
    explicit Book(OrderPool& pool) noexcept;

    // Bound to one arena; a copy would link handles of another engine's pool
    Book(const Book&) = delete;
    Book& operator=(const Book&) = delete;

    /**
     * Append an order at the back of the FIFO at its own side and price.
     * O(log levels) to find or create the level, O(1) to append.
     */
    void rest(OrderHandle handle);

    /**
     * Best level of a side, or nullptr when the side is empty.
     */
    PriceLevel* best(Side side) noexcept;
    const PriceLevel* best(Side side) const noexcept;

    /**
     * Unlink and return the oldest order at a price; erases the level if it empties.
     */
    OrderHandle pop_front(Side side, Price price);

    /**
     * Unlink a specific order (cancellation). O(log levels) + O(1).
     */
    void remove(OrderHandle handle);

    /**
     * Discard all levels on both sides (Flush).
     */
    void clear() noexcept;

    Price best_bid() const noexcept;
    Price best_ask() const noexcept;

    /**
     * True if best bid >= best ask. Must never hold once a command settles.
     */
    bool is_crossed() const noexcept;

    uint64_t level_count(Side side) const noexcept;
    uint64_t order_count(Side side) const noexcept;
    uint64_t volume(Side side) const noexcept;
    bool empty() const noexcept;
};

} // namespace LimitBook
