#pragma once

#include "types.hpp"
#include "logging.hpp"
#include <string>

namespace LimitBook {

/**
 * Static trading rules for the single instrument the book serves.
 * Defaults accept any positive price and any positive quantity up to
 * MAX_ORDER_QUANTITY.
 */
struct InstrumentConfig {
    std::string symbol = "DEFAULT";
    Price tick_size = 1;                  // Minimum price increment, in minor units
    Quantity lot_size = 1;                // Minimum quantity increment
    Quantity max_order_size = UNBOUNDED;  // Maximum single order quantity
    Price price_max = std::numeric_limits<Price>::max();
    int price_decimals = 0;               // Fixed-point digits of prices on the wire and in logs

    bool is_valid_price(Price price) const noexcept {
        return price > 0 &&
               price <= price_max &&
               (price % tick_size) == 0;
    }

    bool is_valid_quantity(Quantity quantity) const noexcept {
        return quantity > 0 &&
               quantity <= MAX_ORDER_QUANTITY &&
               quantity <= max_order_size &&
               (quantity % lot_size) == 0;
    }
};

struct AppConfig {
    std::string input_path;   // Empty => standard input
    bool strict = false;      // Malformed input line is fatal
    bool print_stats = false;
    bool show_help = false;
    LogLevel log_level = LogLevel::INFO;
    uint64_t initial_capacity = DEFAULT_ORDER_CAPACITY;
    InstrumentConfig instrument;
};

// prints usage to stderr
void usage(const char* prog);

/**
 * Parse command line options into config. Returns false and fills error on a
 * bad option or value; config is left partially updated in that case.
 */
bool parse_command_line(int argc, const char* const* argv, AppConfig& config, std::string& error);

} // namespace LimitBook
