#pragma once

#include "types.hpp"
#include <variant>

namespace LimitBook {

struct NewOrderCommand {
    OrderId order_id;
    Side side = Side::BUY;
    Price price = 0;
    Quantity quantity = 0;
};

struct CancelCommand {
    OrderId order_id;
};

struct FlushCommand {};

// Closed set of inbound commands, processed strictly in arrival order
using Command = std::variant<NewOrderCommand, CancelCommand, FlushCommand>;

} // namespace LimitBook
