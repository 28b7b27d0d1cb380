#include "matching_engine.hpp"
#include <algorithm>

namespace LimitBook {

MatchingEngine::MatchingEngine(uint64_t initial_capacity)
    : ledger_(initial_capacity), book_(ledger_.pool()), orders_processed_(0),
      trades_executed_(0), orders_cancelled_(0), flushes_(0),
      total_buy_quantity_matched_(0), total_sell_quantity_matched_(0) {}

ExecutionResult MatchingEngine::execute(const Order& order, std::vector<TradeRecord>& trades) {
    if (ledger_.is_known(order.order_id)) {
        throw InvariantViolation("order " + order.order_id + " reached the engine twice");
    }

    Order aggressor = order;
    aggressor.remaining_quantity = order.original_quantity;

    const Quantity filled = match_order(aggressor, trades);
    ++orders_processed_;

    // Add remainder to book if any quantity left
    if (aggressor.remaining_quantity > 0) {
        const OrderHandle handle = ledger_.insert(aggressor);
        if (handle == INVALID_HANDLE) {
            throw InvariantViolation("ledger refused order " + aggressor.order_id);
        }
        book_.rest(handle);
    } else {
        ledger_.retire(aggressor.order_id);
    }

    return ExecutionResult{filled, aggressor.remaining_quantity};
}

bool MatchingEngine::cancel(const OrderId& order_id) {
    const OrderHandle handle = ledger_.find(order_id);
    if (handle == INVALID_HANDLE) return false;  // Not found or already matched/cancelled

    book_.remove(handle);
    ledger_.remove(order_id);
    ++orders_cancelled_;
    return true;
}

void MatchingEngine::flush() noexcept {
    book_.clear();
    ledger_.clear();
    ++flushes_;
}

Quantity MatchingEngine::match_order(Order& aggressor, std::vector<TradeRecord>& trades) {
    const Side resting_side = opposite(aggressor.side);
    Quantity filled = 0;

    // Walk the opposite side from its best level while prices still cross
    while (aggressor.remaining_quantity > 0) {
        PriceLevel* level = book_.best(resting_side);
        if (!level) break;

        const bool crosses = (aggressor.side == Side::BUY) ? level->price <= aggressor.price
                                                           : level->price >= aggressor.price;
        if (!crosses) break;

        const OrderHandle resting = level->front();
        const Quantity trade_quantity =
            std::min(aggressor.remaining_quantity, ledger_.get(resting).remaining_quantity);

        execute_trade(aggressor, resting, trade_quantity, trades);
        level->reduce_volume(trade_quantity);
        filled += trade_quantity;

        if (ledger_.fill(resting, trade_quantity)) {
            // Resting order fully matched, detach it (level may be erased here)
            const Price price = level->price;
            if (book_.pop_front(resting_side, price) != resting) {
                throw InvariantViolation("level head changed while matching at price " +
                                         std::to_string(price));
            }
            ledger_.release(resting);
        }
    }

    return filled;
}

void MatchingEngine::execute_trade(Order& aggressor, OrderHandle resting, Quantity quantity,
                                   std::vector<TradeRecord>& trades) {
    const Order& maker = ledger_.get(resting);
    if (quantity == 0 || quantity > aggressor.remaining_quantity) {
        throw InvariantViolation("trade of " + std::to_string(quantity) + " for order " +
                                 aggressor.order_id);
    }
    aggressor.remaining_quantity -= quantity;

    trades.push_back(TradeRecord{aggressor.order_id, maker.order_id, maker.price, quantity});

    // Update statistics
    ++trades_executed_;
    total_buy_quantity_matched_ = saturating_add(total_buy_quantity_matched_, quantity);
    total_sell_quantity_matched_ = saturating_add(total_sell_quantity_matched_, quantity);
}

bool MatchingEngine::is_known(const OrderId& order_id) const noexcept {
    return ledger_.is_known(order_id);
}

const Book& MatchingEngine::book() const noexcept {
    return book_;
}

const OrderLedger& MatchingEngine::ledger() const noexcept {
    return ledger_;
}

uint64_t MatchingEngine::orders_processed() const noexcept {
    return orders_processed_;
}

uint64_t MatchingEngine::trades_executed() const noexcept {
    return trades_executed_;
}

uint64_t MatchingEngine::orders_cancelled() const noexcept {
    return orders_cancelled_;
}

uint64_t MatchingEngine::flushes() const noexcept {
    return flushes_;
}

uint64_t MatchingEngine::total_buy_quantity_matched() const noexcept {
    return total_buy_quantity_matched_;
}

uint64_t MatchingEngine::total_sell_quantity_matched() const noexcept {
    return total_sell_quantity_matched_;
}

} // namespace LimitBook
