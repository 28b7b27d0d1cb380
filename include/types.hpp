#pragma once

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace LimitBook {

// Configuration constants
constexpr uint64_t DEFAULT_ORDER_CAPACITY = 1 << 16;   // Arena slots reserved up front
constexpr uint64_t UNBOUNDED = std::numeric_limits<uint64_t>::max();
constexpr int MAX_PRICE_DECIMALS = 9;

// Largest quantity a single order may carry. With at most 2^32 live orders the
// volume of any level or side stays below 2^64.
constexpr uint64_t MAX_ORDER_QUANTITY = std::numeric_limits<uint32_t>::max();

// Scalar vocabulary
using OrderId = std::string;
using Price = int64_t;        // Minor units, always positive on the book
using Quantity = uint64_t;
using Sequence = uint64_t;
using OrderHandle = uint32_t; // Slot index into the order arena

constexpr OrderHandle INVALID_HANDLE = std::numeric_limits<OrderHandle>::max();
constexpr Price NO_PRICE = -1;

// Enumerations
enum class Side : uint8_t {
    BUY,
    SELL
};

constexpr Side opposite(Side side) noexcept {
    return side == Side::BUY ? Side::SELL : Side::BUY;
}

const char* to_string(Side side) noexcept;

// Counter addition that sticks at the maximum instead of wrapping
constexpr uint64_t saturating_add(uint64_t a, uint64_t b) noexcept {
    return b > std::numeric_limits<uint64_t>::max() - a ? std::numeric_limits<uint64_t>::max() : a + b;
}

// Core data structures
struct Order {
    OrderId order_id;
    Side side;
    Price price;
    Quantity original_quantity;
    Quantity remaining_quantity;
    Sequence sequence;

    // Intrusive FIFO links, expressed as arena handles
    OrderHandle next;
    OrderHandle prev;

    Order() noexcept;
    Order(OrderId id, Side s, Price p, Quantity qty, Sequence seq);
};

/**
 * Raised when the ledger and ladder disagree or a fill would overdraw an order.
 * Indicates a bug, never bad input: processing of the current command stops.
 */
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& what);
};

} // namespace LimitBook
