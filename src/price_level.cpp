#include "price_level.hpp"

namespace LimitBook {

PriceLevel::PriceLevel(Price p) noexcept
    : price(p), total_volume(0), order_count(0), head(INVALID_HANDLE), tail(INVALID_HANDLE) {}

void PriceLevel::add_order(OrderPool& pool, OrderHandle handle) noexcept {
    Order& order = pool.get(handle);
    order.next = INVALID_HANDLE;

    if (head == INVALID_HANDLE) {
        head = tail = handle;
        order.prev = INVALID_HANDLE;
    } else {
        pool.get(tail).next = handle;
        order.prev = tail;
        tail = handle;
    }
    total_volume += order.remaining_quantity;
    ++order_count;
}

void PriceLevel::remove_order(OrderPool& pool, OrderHandle handle) noexcept {
    Order& order = pool.get(handle);

    if (order.prev != INVALID_HANDLE) {
        pool.get(order.prev).next = order.next;
    } else {
        head = order.next;
    }

    if (order.next != INVALID_HANDLE) {
        pool.get(order.next).prev = order.prev;
    } else {
        tail = order.prev;
    }

    order.next = order.prev = INVALID_HANDLE;
    total_volume -= order.remaining_quantity;
    --order_count;
}

void PriceLevel::reduce_volume(Quantity quantity) noexcept {
    total_volume -= quantity;
}

OrderHandle PriceLevel::front() const noexcept {
    return head;
}

bool PriceLevel::empty() const noexcept {
    return head == INVALID_HANDLE;
}

} // namespace LimitBook
