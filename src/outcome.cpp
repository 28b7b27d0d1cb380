#include "outcome.hpp"

namespace LimitBook {

const char* to_string(RejectReason reason) noexcept {
    switch (reason) {
        case RejectReason::INVALID_QUANTITY: return "InvalidQuantity";
        case RejectReason::INVALID_PRICE: return "InvalidPrice";
        case RejectReason::DUPLICATE_IDENTIFIER: return "DuplicateIdentifier";
        case RejectReason::UNKNOWN_ORDER: return "UnknownOrder";
    }
    return "Unknown";
}

bool operator==(const AckRecord& lhs, const AckRecord& rhs) noexcept {
    return lhs.order_id == rhs.order_id &&
           lhs.filled_quantity == rhs.filled_quantity &&
           lhs.resting_quantity == rhs.resting_quantity;
}

bool operator==(const TradeRecord& lhs, const TradeRecord& rhs) noexcept {
    return lhs.taker_order_id == rhs.taker_order_id &&
           lhs.maker_order_id == rhs.maker_order_id &&
           lhs.price == rhs.price &&
           lhs.quantity == rhs.quantity;
}

bool operator==(const CancelledRecord& lhs, const CancelledRecord& rhs) noexcept {
    return lhs.order_id == rhs.order_id;
}

bool operator==(const FlushedRecord&, const FlushedRecord&) noexcept {
    return true;
}

bool operator==(const RejectedRecord& lhs, const RejectedRecord& rhs) noexcept {
    return lhs.order_id == rhs.order_id && lhs.reason == rhs.reason;
}

} // namespace LimitBook
