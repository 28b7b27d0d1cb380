#pragma once

#include "types.hpp"
#include "command.hpp"
#include "outcome.hpp"
#include <string>
#include <string_view>

namespace LimitBook {

enum class LineKind : uint8_t {
    COMMAND,    // command holds a parsed command
    SKIP,       // blank line or comment
    MALFORMED   // error holds a description
};

struct ParsedLine {
    LineKind kind = LineKind::SKIP;
    Command command;
    std::string error;
};

/**
 * Parse one input line:
 *   N,<id>,<B|S>,<price>,<qty>
 *   C,<id>
 *   F
 * Fields are comma separated and trimmed; '#' at line start marks a comment.
 * Prices are fixed-point with `price_decimals` digits and are converted
 * exactly to integer minor units. Zero or negative prices and zero quantities
 * parse fine: rejecting them is the book's job, not the reader's.
 */
ParsedLine parse_line(std::string_view line, int price_decimals);

/**
 * Fixed-point text to minor units, e.g. ("100.25", 2) -> 10025.
 * Returns false on syntax error, overflow, or excess precision.
 */
bool parse_price(std::string_view text, int price_decimals, Price& out) noexcept;

std::string format_price(Price price, int price_decimals);

/**
 * One output line (without the newline) for an outcome record.
 */
std::string format_outcome(const Outcome& outcome, int price_decimals);

} // namespace LimitBook
