#pragma once

#include "types.hpp"
#include <variant>
#include <vector>

namespace LimitBook {

enum class RejectReason : uint8_t {
    INVALID_QUANTITY,
    INVALID_PRICE,
    DUPLICATE_IDENTIFIER,
    UNKNOWN_ORDER
};

const char* to_string(RejectReason reason) noexcept;

/**
 * Final record for every accepted New: what traded on entry and what rests.
 */
struct AckRecord {
    OrderId order_id;
    Quantity filled_quantity = 0;
    Quantity resting_quantity = 0;
};

/**
 * One execution. Price is always the maker's resting price.
 */
struct TradeRecord {
    OrderId taker_order_id;
    OrderId maker_order_id;
    Price price = 0;
    Quantity quantity = 0;
};

struct CancelledRecord {
    OrderId order_id;
};

struct FlushedRecord {};

struct RejectedRecord {
    OrderId order_id;  // Empty when the command carried no identifier
    RejectReason reason = RejectReason::UNKNOWN_ORDER;
};

using Outcome = std::variant<AckRecord, TradeRecord, CancelledRecord, FlushedRecord, RejectedRecord>;
using Outcomes = std::vector<Outcome>;

bool operator==(const AckRecord& lhs, const AckRecord& rhs) noexcept;
bool operator==(const TradeRecord& lhs, const TradeRecord& rhs) noexcept;
bool operator==(const CancelledRecord& lhs, const CancelledRecord& rhs) noexcept;
bool operator==(const FlushedRecord& lhs, const FlushedRecord& rhs) noexcept;
bool operator==(const RejectedRecord& lhs, const RejectedRecord& rhs) noexcept;

} // namespace LimitBook
