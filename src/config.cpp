#include "config.hpp"

#include <charconv>
#include <iostream>
#include <string_view>

namespace LimitBook {

namespace {

template <typename T>
bool parse_number(std::string_view sv, T& out) {
    if (sv.empty()) return false;
    const char* begin = sv.data();
    const char* end = sv.data() + sv.size();
    auto res = std::from_chars(begin, end, out);
    return res.ec == std::errc{} && res.ptr == end;
}

// Pulls the value of "--opt VALUE" or "--opt=VALUE"
bool take_value(int argc, const char* const* argv, int& i, std::string_view arg,
                std::string_view inline_value, bool has_inline, std::string& value,
                std::string& error) {
    if (has_inline) {
        value = std::string(inline_value);
        return true;
    }
    if (i + 1 >= argc) {
        error = "option " + std::string(arg) + " requires a value";
        return false;
    }
    value = argv[++i];
    return true;
}

template <typename T>
bool take_positive(const std::string& option, const std::string& value, T& out, std::string& error) {
    T parsed{};
    if (!parse_number(value, parsed) || parsed <= 0) {
        error = "option " + option + " expects a positive integer, got '" + value + "'";
        return false;
    }
    out = parsed;
    return true;
}

} // namespace

void usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " [options]\n"
        << "Reads order commands (one per line) and writes outcome records to stdout.\n"
        << "\n"
        << "Input lines:   N,<id>,<B|S>,<price>,<qty> | C,<id> | F   ('#' starts a comment)\n"
        << "Output lines:  A,<id>,<filled>,<resting> | T,<taker>,<maker>,<price>,<qty>\n"
        << "               X,<id> | F | R,<id|->,<reason>\n"
        << "\n"
        << "Options:\n"
        << "  -i, --input FILE        read commands from FILE instead of stdin\n"
        << "      --price-decimals N  fixed-point digits in prices (0-" << MAX_PRICE_DECIMALS << ", default 0)\n"
        << "      --tick-size N       minimum price increment in minor units (default 1)\n"
        << "      --lot-size N        minimum quantity increment (default 1)\n"
        << "      --max-order-size N  largest accepted order quantity (default unbounded)\n"
        << "      --max-price N       largest accepted price in minor units (default unbounded)\n"
        << "      --symbol NAME       instrument symbol used in diagnostics\n"
        << "      --capacity N        order slots reserved at startup\n"
        << "      --strict            stop on the first malformed input line\n"
        << "      --stats             log engine statistics at exit\n"
        << "  -v, --verbose           debug diagnostics on stderr\n"
        << "  -q, --quiet             errors only on stderr\n"
        << "  -h, --help              show this help\n";
}

bool parse_command_line(int argc, const char* const* argv, AppConfig& config, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);
        std::string_view inline_value;
        bool has_inline = false;

        if (arg.rfind("--", 0) == 0) {
            const auto eq = arg.find('=');
            if (eq != std::string_view::npos) {
                inline_value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
                has_inline = true;
            }
        }

        const std::string option(arg);
        std::string value;

        if (option == "-h" || option == "--help") {
            config.show_help = true;
        } else if (option == "-v" || option == "--verbose") {
            config.log_level = LogLevel::DEBUG;
        } else if (option == "-q" || option == "--quiet") {
            config.log_level = LogLevel::ERROR;
        } else if (option == "--strict") {
            config.strict = true;
        } else if (option == "--stats") {
            config.print_stats = true;
        } else if (option == "-i" || option == "--input") {
            if (!take_value(argc, argv, i, arg, inline_value, has_inline, value, error)) return false;
            if (value.empty()) {
                error = "option " + option + " expects a file name";
                return false;
            }
            config.input_path = value;
        } else if (option == "--symbol") {
            if (!take_value(argc, argv, i, arg, inline_value, has_inline, value, error)) return false;
            config.instrument.symbol = value;
        } else if (option == "--price-decimals") {
            if (!take_value(argc, argv, i, arg, inline_value, has_inline, value, error)) return false;
            int decimals = -1;
            if (!parse_number(value, decimals) || decimals < 0 || decimals > MAX_PRICE_DECIMALS) {
                error = "option " + option + " expects 0-" + std::to_string(MAX_PRICE_DECIMALS) +
                        ", got '" + value + "'";
                return false;
            }
            config.instrument.price_decimals = decimals;
        } else if (option == "--tick-size") {
            if (!take_value(argc, argv, i, arg, inline_value, has_inline, value, error)) return false;
            if (!take_positive(option, value, config.instrument.tick_size, error)) return false;
        } else if (option == "--lot-size") {
            if (!take_value(argc, argv, i, arg, inline_value, has_inline, value, error)) return false;
            if (!take_positive(option, value, config.instrument.lot_size, error)) return false;
        } else if (option == "--max-order-size") {
            if (!take_value(argc, argv, i, arg, inline_value, has_inline, value, error)) return false;
            if (!take_positive(option, value, config.instrument.max_order_size, error)) return false;
        } else if (option == "--max-price") {
            if (!take_value(argc, argv, i, arg, inline_value, has_inline, value, error)) return false;
            if (!take_positive(option, value, config.instrument.price_max, error)) return false;
        } else if (option == "--capacity") {
            if (!take_value(argc, argv, i, arg, inline_value, has_inline, value, error)) return false;
            if (!take_positive(option, value, config.initial_capacity, error)) return false;
        } else {
            error = "unknown option '" + std::string(argv[i]) + "'";
            return false;
        }
    }
    return true;
}

} // namespace LimitBook
