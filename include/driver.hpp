#pragma once

#include "config.hpp"
#include <istream>
#include <ostream>

namespace LimitBook {

// Process exit statuses
constexpr int EXIT_OK = 0;
constexpr int EXIT_IO_FAILURE = 1;      // Input unreadable or output unwritable
constexpr int EXIT_BAD_INPUT = 2;       // Bad command line, or malformed line under --strict
constexpr int EXIT_INTERNAL_FAULT = 3;  // InvariantViolation raised by the core

/**
 * Feed every line of input through one CommandProcessor and write the outcome
 * records to output, one per line, in production order.
 *
 * Malformed lines are logged with their line number and skipped, or end the
 * run under config.strict. Records already written stay written; the records
 * of a command that faults are dropped. Returns one of the EXIT_* statuses.
 */
int run(std::istream& input, std::ostream& output, const AppConfig& config);

} // namespace LimitBook
