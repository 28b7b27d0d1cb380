#include "driver.hpp"
#include "command_processor.hpp"
#include "logging.hpp"
#include "wire_format.hpp"
#include <string>

namespace LimitBook {

namespace {

bool emit(std::ostream& output, const Outcomes& outcomes, int price_decimals) {
    for (const Outcome& outcome : outcomes) {
        output << format_outcome(outcome, price_decimals) << '\n';
    }
    return static_cast<bool>(output);
}

} // namespace

int run(std::istream& input, std::ostream& output, const AppConfig& config) {
    const int price_decimals = config.instrument.price_decimals;
    CommandProcessor processor(config.instrument, config.initial_capacity);
    Outcomes outcomes;
    std::string line;
    uint64_t line_number = 0;
    uint64_t malformed_lines = 0;

    while (std::getline(input, line)) {
        ++line_number;

        const ParsedLine parsed = parse_line(line, price_decimals);
        if (parsed.kind == LineKind::SKIP) continue;

        if (parsed.kind == LineKind::MALFORMED) {
            ++malformed_lines;
            if (config.strict) {
                output.flush();
                logger().error("line ", line_number, ": ", parsed.error);
                return EXIT_BAD_INPUT;
            }
            logger().warn("line ", line_number, ": ", parsed.error, ", skipped");
            continue;
        }

        outcomes.clear();
        try {
            processor.process(parsed.command, outcomes);
        } catch (const InvariantViolation& e) {
            // Records of the aborted command are dropped
            output.flush();
            logger().error("line ", line_number, ": ", e.what());
            return EXIT_INTERNAL_FAULT;
        }

        if (!emit(output, outcomes, price_decimals)) {
            logger().error("failed to write output records");
            return EXIT_IO_FAILURE;
        }
    }

    if (input.bad()) {
        logger().error("failed to read input after line ", line_number);
        return EXIT_IO_FAILURE;
    }

    output.flush();
    if (!output) {
        logger().error("failed to write output records");
        return EXIT_IO_FAILURE;
    }

    if (malformed_lines > 0) {
        logger().warn(malformed_lines, " malformed line(s) skipped");
    }
    if (config.print_stats) {
        processor.log_statistics();
    }
    return EXIT_OK;
}

} // namespace LimitBook
