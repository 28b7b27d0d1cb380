#pragma once

#include "types.hpp"
#include "command.hpp"
#include "config.hpp"
#include "matching_engine.hpp"
#include "outcome.hpp"
#include <vector>

namespace LimitBook {

/**
 * Entry point of the book: takes one command at a time, in arrival order, and
 * returns the outcome records it produced, in emission order.
 *
 * Holds the only arrival sequence counter. The counter never rewinds, not even
 * on Flush, so a sequence number is never handed out twice in a process.
 * Rejected commands leave the book untouched and consume no sequence number.
 */
class CommandProcessor {
private:
    InstrumentConfig instrument_;
    MatchingEngine engine_;
    Sequence next_sequence_;
    uint64_t commands_processed_;
    uint64_t orders_rejected_;
    std::vector<TradeRecord> trade_buffer_;

    void handle_new_order(const NewOrderCommand& cmd, Outcomes& out);
    void handle_cancel_order(const CancelCommand& cmd, Outcomes& out);
    void handle_flush(Outcomes& out);
    void reject(const OrderId& order_id, RejectReason reason, Outcomes& out);

public:
    explicit CommandProcessor(InstrumentConfig instrument = InstrumentConfig{},
                              uint64_t initial_capacity = DEFAULT_ORDER_CAPACITY);

    /**
     * Apply one command. Throws InvariantViolation on an internal logic fault;
     * the book must not be used after that.
     */
    Outcomes process(const Command& command);

    /**
     * Same as process(), appending to an existing buffer.
     */
    void process(const Command& command, Outcomes& out);

    const MatchingEngine& engine() const noexcept;
    const InstrumentConfig& instrument() const noexcept;

    uint64_t commands_processed() const noexcept;
    uint64_t orders_rejected() const noexcept;
    Sequence next_sequence() const noexcept;

    /**
     * Log the statistics block (orders, trades, matched quantity balance).
     */
    void log_statistics() const;
};

} // namespace LimitBook
