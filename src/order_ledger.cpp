#include "order_ledger.hpp"

namespace LimitBook {

OrderLedger::OrderLedger(uint64_t initial_capacity)
    : pool_(initial_capacity) {
    live_.reserve(initial_capacity);
}

OrderHandle OrderLedger::insert(const Order& order) {
    if (is_known(order.order_id)) {
        return INVALID_HANDLE;
    }

    const OrderHandle handle = pool_.allocate();
    pool_.get(handle) = order;
    live_.emplace(order.order_id, handle);
    return handle;
}

OrderHandle OrderLedger::find(const OrderId& order_id) const noexcept {
    const auto it = live_.find(order_id);
    return it == live_.end() ? INVALID_HANDLE : it->second;
}

Order& OrderLedger::get(OrderHandle handle) noexcept {
    return pool_.get(handle);
}

const Order& OrderLedger::get(OrderHandle handle) const noexcept {
    return pool_.get(handle);
}

bool OrderLedger::remove(const OrderId& order_id) {
    const auto it = live_.find(order_id);
    if (it == live_.end()) return false;

    const OrderHandle handle = it->second;
    live_.erase(it);
    retired_.insert(order_id);
    pool_.free(handle);
    return true;
}

bool OrderLedger::fill(OrderHandle handle, Quantity quantity) {
    Order& order = pool_.get(handle);
    if (quantity == 0 || quantity > order.remaining_quantity) {
        throw InvariantViolation("fill of " + std::to_string(quantity) + " against order " +
                                 order.order_id + " with remaining " +
                                 std::to_string(order.remaining_quantity));
    }

    order.remaining_quantity -= quantity;
    return order.remaining_quantity == 0;
}

void OrderLedger::release(OrderHandle handle) {
    const OrderId order_id = pool_.get(handle).order_id;
    if (live_.erase(order_id) == 0) {
        throw InvariantViolation("release of order " + order_id + " missing from ledger");
    }
    retired_.insert(order_id);
    pool_.free(handle);
}

void OrderLedger::retire(const OrderId& order_id) {
    retired_.insert(order_id);
}

bool OrderLedger::is_known(const OrderId& order_id) const noexcept {
    return live_.count(order_id) != 0 || retired_.count(order_id) != 0;
}

void OrderLedger::clear() noexcept {
    live_.clear();
    retired_.clear();
    pool_.clear();
}

OrderPool& OrderLedger::pool() noexcept {
    return pool_;
}

const OrderPool& OrderLedger::pool() const noexcept {
    return pool_;
}

uint64_t OrderLedger::live_count() const noexcept {
    return live_.size();
}

uint64_t OrderLedger::retired_count() const noexcept {
    return retired_.size();
}

} // namespace LimitBook
