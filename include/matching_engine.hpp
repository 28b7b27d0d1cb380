#pragma once

#include "types.hpp"
#include "book.hpp"
#include "order_ledger.hpp"
#include "outcome.hpp"
#include <vector>

namespace LimitBook {

struct ExecutionResult {
    Quantity filled_quantity = 0;
    Quantity resting_quantity = 0;
};

/**
 * Single-threaded matching engine that owns the ledger and the ladder of one
 * instrument. Enforces price-time priority: best price first, then oldest
 * arrival at that price. Trades always print at the maker's resting price.
 *
 * Input is assumed validated; rejections are the command processor's business.
 */
class MatchingEngine {
private:
    OrderLedger ledger_;
    Book book_;

    // Statistics
    uint64_t orders_processed_;
    uint64_t trades_executed_;
    uint64_t orders_cancelled_;
    uint64_t flushes_;
    uint64_t total_buy_quantity_matched_;
    uint64_t total_sell_quantity_matched_;

    Quantity match_order(Order& aggressor, std::vector<TradeRecord>& trades);
    void execute_trade(Order& aggressor, OrderHandle resting, Quantity quantity,
                       std::vector<TradeRecord>& trades);

public:
    explicit MatchingEngine(uint64_t initial_capacity = DEFAULT_ORDER_CAPACITY);

    MatchingEngine(const MatchingEngine&) = delete;
    MatchingEngine& operator=(const MatchingEngine&) = delete;

    /**
     * Match an incoming order against the opposite side, appending trades in
     * execution order, then rest any remainder at its limit price.
     * An order filled on entry never rests; its identifier is still reserved.
     */
    ExecutionResult execute(const Order& order, std::vector<TradeRecord>& trades);

    /**
     * Remove a live order. Returns false if the identifier is not live.
     */
    bool cancel(const OrderId& order_id);

    /**
     * Drop every resting order and forget all identifiers.
     */
    void flush() noexcept;

    bool is_known(const OrderId& order_id) const noexcept;

    const Book& book() const noexcept;
    const OrderLedger& ledger() const noexcept;

    // Getters for statistics
    uint64_t orders_processed() const noexcept;
    uint64_t trades_executed() const noexcept;
    uint64_t orders_cancelled() const noexcept;
    uint64_t flushes() const noexcept;
    uint64_t total_buy_quantity_matched() const noexcept;
    uint64_t total_sell_quantity_matched() const noexcept;
};

} // namespace LimitBook
