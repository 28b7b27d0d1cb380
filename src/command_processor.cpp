#include "command_processor.hpp"
#include "logging.hpp"
#include "wire_format.hpp"
#include <type_traits>
#include <utility>

namespace LimitBook {

namespace {

std::string describe_price(Price price, int price_decimals) {
    return price == NO_PRICE ? "-" : format_price(price, price_decimals);
}

} // namespace

CommandProcessor::CommandProcessor(InstrumentConfig instrument, uint64_t initial_capacity)
    : instrument_(std::move(instrument)), engine_(initial_capacity), next_sequence_(1),
      commands_processed_(0), orders_rejected_(0) {}

Outcomes CommandProcessor::process(const Command& command) {
    Outcomes out;
    process(command, out);
    return out;
}

void CommandProcessor::process(const Command& command, Outcomes& out) {
    std::visit([&](const auto& cmd) {
        using T = std::decay_t<decltype(cmd)>;
        if constexpr (std::is_same_v<T, NewOrderCommand>) {
            handle_new_order(cmd, out);
        } else if constexpr (std::is_same_v<T, CancelCommand>) {
            handle_cancel_order(cmd, out);
        } else if constexpr (std::is_same_v<T, FlushCommand>) {
            handle_flush(out);
        } else {
            static_assert(std::is_same_v<T, void>, "unhandled command");
        }
    }, command);

    ++commands_processed_;

    if (engine_.book().is_crossed()) {
        throw InvariantViolation("book crossed after command " + std::to_string(commands_processed_) +
                                 ": bid " + std::to_string(engine_.book().best_bid()) +
                                 " ask " + std::to_string(engine_.book().best_ask()));
    }
}

void CommandProcessor::handle_new_order(const NewOrderCommand& cmd, Outcomes& out) {
    if (!instrument_.is_valid_price(cmd.price)) {
        reject(cmd.order_id, RejectReason::INVALID_PRICE, out);
        return;
    }
    if (!instrument_.is_valid_quantity(cmd.quantity)) {
        reject(cmd.order_id, RejectReason::INVALID_QUANTITY, out);
        return;
    }
    if (engine_.is_known(cmd.order_id)) {
        reject(cmd.order_id, RejectReason::DUPLICATE_IDENTIFIER, out);
        return;
    }

    const Order order(cmd.order_id, cmd.side, cmd.price, cmd.quantity, next_sequence_++);

    trade_buffer_.clear();
    const ExecutionResult result = engine_.execute(order, trade_buffer_);

    for (TradeRecord& trade : trade_buffer_) {
        out.emplace_back(std::move(trade));
    }
    out.emplace_back(AckRecord{cmd.order_id, result.filled_quantity, result.resting_quantity});

    if (result.filled_quantity + result.resting_quantity != cmd.quantity) {
        throw InvariantViolation("order " + cmd.order_id + " lost quantity: filled " +
                                 std::to_string(result.filled_quantity) + " resting " +
                                 std::to_string(result.resting_quantity) + " of " +
                                 std::to_string(cmd.quantity));
    }

    logger().debug("NEW ", cmd.order_id, " ", to_string(cmd.side), " ", cmd.quantity, "@", cmd.price,
                   " seq=", order.sequence, " filled=", result.filled_quantity,
                   " resting=", result.resting_quantity);
}

void CommandProcessor::handle_cancel_order(const CancelCommand& cmd, Outcomes& out) {
    if (!engine_.cancel(cmd.order_id)) {
        reject(cmd.order_id, RejectReason::UNKNOWN_ORDER, out);
        return;
    }

    out.emplace_back(CancelledRecord{cmd.order_id});
    logger().debug("CANCEL ", cmd.order_id);
}

void CommandProcessor::handle_flush(Outcomes& out) {
    const Book& book = engine_.book();
    logger().info("FLUSH ", instrument_.symbol,
                  ": spread bid=", describe_price(book.best_bid(), instrument_.price_decimals),
                  " ask=", describe_price(book.best_ask(), instrument_.price_decimals),
                  " resting bids=", book.order_count(Side::BUY),
                  " asks=", book.order_count(Side::SELL),
                  " levels bids=", book.level_count(Side::BUY),
                  " asks=", book.level_count(Side::SELL));

    engine_.flush();
    out.emplace_back(FlushedRecord{});
}

void CommandProcessor::reject(const OrderId& order_id, RejectReason reason, Outcomes& out) {
    ++orders_rejected_;
    out.emplace_back(RejectedRecord{order_id, reason});
    logger().debug("REJECT ", order_id, " ", to_string(reason));
}

const MatchingEngine& CommandProcessor::engine() const noexcept {
    return engine_;
}

const InstrumentConfig& CommandProcessor::instrument() const noexcept {
    return instrument_;
}

uint64_t CommandProcessor::commands_processed() const noexcept {
    return commands_processed_;
}

uint64_t CommandProcessor::orders_rejected() const noexcept {
    return orders_rejected_;
}

Sequence CommandProcessor::next_sequence() const noexcept {
    return next_sequence_;
}

void CommandProcessor::log_statistics() const {
    const uint64_t buy_matched = engine_.total_buy_quantity_matched();
    const uint64_t sell_matched = engine_.total_sell_quantity_matched();

    logger().info("=== STATISTICS (", instrument_.symbol, ") ===");
    logger().info("Commands processed: ", commands_processed_);
    logger().info("Orders accepted: ", engine_.orders_processed());
    logger().info("Orders rejected: ", orders_rejected_);
    logger().info("Orders cancelled: ", engine_.orders_cancelled());
    logger().info("Trades executed: ", engine_.trades_executed());
    logger().info("Flushes: ", engine_.flushes());
    logger().info("Resting orders: ", engine_.ledger().live_count());
    logger().info("Match balance: ", (buy_matched == sell_matched ? "PASS" : "FAIL"),
                  " (buy ", buy_matched, " / sell ", sell_matched, ")");
}

} // namespace LimitBook
