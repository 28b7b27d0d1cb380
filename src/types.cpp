#include "types.hpp"

#include <utility>

namespace LimitBook {

const char* to_string(Side side) noexcept {
    return side == Side::BUY ? "BUY" : "SELL";
}

Order::Order() noexcept
    : side(Side::BUY), price(0), original_quantity(0), remaining_quantity(0),
      sequence(0), next(INVALID_HANDLE), prev(INVALID_HANDLE) {}

Order::Order(OrderId id, Side s, Price p, Quantity qty, Sequence seq)
    : order_id(std::move(id)), side(s), price(p), original_quantity(qty),
      remaining_quantity(qty), sequence(seq), next(INVALID_HANDLE), prev(INVALID_HANDLE) {}

InvariantViolation::InvariantViolation(const std::string& what)
    : std::logic_error("invariant violation: " + what) {}

} // namespace LimitBook
