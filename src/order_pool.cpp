#include "order_pool.hpp"

namespace LimitBook {

OrderPool::OrderPool(uint64_t initial_capacity)
    : free_head_(INVALID_HANDLE), allocated_count_(0) {
    pool_.reserve(initial_capacity);
}

OrderHandle OrderPool::allocate() {
    OrderHandle handle;
    if (free_head_ != INVALID_HANDLE) {
        handle = free_head_;
        free_head_ = pool_[handle].next;
        pool_[handle] = Order();
    } else {
        if (pool_.size() >= INVALID_HANDLE) {
            throw InvariantViolation("order arena exhausted");
        }
        handle = static_cast<OrderHandle>(pool_.size());
        pool_.emplace_back();
    }

    ++allocated_count_;
    return handle;
}

void OrderPool::free(OrderHandle handle) noexcept {
    if (handle == INVALID_HANDLE || handle >= pool_.size()) return;

    Order& order = pool_[handle];
    order.order_id.clear();
    order.prev = INVALID_HANDLE;
    order.next = free_head_;
    free_head_ = handle;
    --allocated_count_;
}

Order& OrderPool::get(OrderHandle handle) noexcept {
    return pool_[handle];
}

const Order& OrderPool::get(OrderHandle handle) const noexcept {
    return pool_[handle];
}

void OrderPool::clear() noexcept {
    pool_.clear();
    free_head_ = INVALID_HANDLE;
    allocated_count_ = 0;
}

uint64_t OrderPool::allocated_count() const noexcept {
    return allocated_count_;
}

uint64_t OrderPool::available_count() const noexcept {
    return capacity() - allocated_count_;
}

uint64_t OrderPool::capacity() const noexcept {
    return pool_.capacity();
}

} // namespace LimitBook
