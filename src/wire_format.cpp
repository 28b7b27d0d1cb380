#include "wire_format.hpp"

#include <charconv>
#include <sstream>
#include <type_traits>
#include <utility>
#include <vector>

namespace LimitBook {

namespace {

std::string_view trim(std::string_view s) noexcept {
    const auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

void split_fields(std::string_view s, std::vector<std::string_view>& out) {
    out.clear();
    size_t start = 0;
    for (size_t i = 0; i <= s.size(); ++i) {
        if (i == s.size() || s[i] == ',') {
            out.push_back(trim(s.substr(start, i - start)));
            start = i + 1;
        }
    }
}

template <typename T>
bool parse_int(std::string_view sv, T& out) noexcept {
    if (sv.empty()) return false;
    const char* begin = sv.data();
    const char* end = sv.data() + sv.size();
    auto res = std::from_chars(begin, end, out);
    return res.ec == std::errc{} && res.ptr == end;
}

bool is_valid_identifier(std::string_view id) noexcept {
    if (id.empty()) return false;
    for (char c : id) {
        if (c == ' ' || c == '\t') return false;
    }
    return true;
}

ParsedLine malformed(std::string message) {
    ParsedLine parsed;
    parsed.kind = LineKind::MALFORMED;
    parsed.error = std::move(message);
    return parsed;
}

std::string wrong_arity(std::string_view kind, size_t expected, size_t got) {
    std::ostringstream oss;
    oss << "'" << kind << "' expects " << expected << " fields, got " << got;
    return oss.str();
}

} // namespace

bool parse_price(std::string_view text, int price_decimals, Price& out) noexcept {
    if (text.empty() || price_decimals < 0 || price_decimals > MAX_PRICE_DECIMALS) return false;

    bool negative = false;
    if (text.front() == '-' || text.front() == '+') {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }

    std::string_view whole = text;
    std::string_view fraction;
    const auto dot = text.find('.');
    if (dot != std::string_view::npos) {
        whole = text.substr(0, dot);
        fraction = text.substr(dot + 1);
        if (fraction.empty()) return false;
    }
    if (whole.empty()) return false;

    // Digits beyond the configured precision must be zeros
    while (fraction.size() > static_cast<size_t>(price_decimals)) {
        if (fraction.back() != '0') return false;
        fraction.remove_suffix(1);
    }

    Price whole_value = 0;
    if (!parse_int(whole, whole_value) || whole_value < 0) return false;

    Price fraction_value = 0;
    if (!fraction.empty() && !parse_int(fraction, fraction_value)) return false;
    if (fraction_value < 0) return false;

    Price scale = 1;
    for (int i = 0; i < price_decimals; ++i) scale *= 10;
    for (size_t i = fraction.size(); i < static_cast<size_t>(price_decimals); ++i) fraction_value *= 10;

    if (whole_value > (std::numeric_limits<Price>::max() - fraction_value) / scale) return false;

    const Price value = whole_value * scale + fraction_value;
    out = negative ? -value : value;
    return true;
}

std::string format_price(Price price, int price_decimals) {
    if (price_decimals <= 0) return std::to_string(price);

    Price scale = 1;
    for (int i = 0; i < price_decimals; ++i) scale *= 10;

    const bool negative = price < 0;
    const uint64_t magnitude = negative ? static_cast<uint64_t>(-(price + 1)) + 1 : static_cast<uint64_t>(price);
    const uint64_t whole = magnitude / static_cast<uint64_t>(scale);
    std::string fraction = std::to_string(magnitude % static_cast<uint64_t>(scale));
    fraction.insert(0, static_cast<size_t>(price_decimals) - fraction.size(), '0');

    return (negative ? "-" : "") + std::to_string(whole) + "." + fraction;
}

ParsedLine parse_line(std::string_view line, int price_decimals) {
    line = trim(line);
    if (line.empty() || line.front() == '#') {
        return ParsedLine{};
    }

    std::vector<std::string_view> fields;
    split_fields(line, fields);

    const std::string_view kind = fields[0];
    ParsedLine parsed;
    parsed.kind = LineKind::COMMAND;

    if (kind == "N") {
        if (fields.size() != 5) return malformed(wrong_arity(kind, 5, fields.size()));

        NewOrderCommand cmd;
        if (!is_valid_identifier(fields[1])) {
            return malformed("invalid order identifier '" + std::string(fields[1]) + "'");
        }
        cmd.order_id = std::string(fields[1]);

        if (fields[2] == "B") {
            cmd.side = Side::BUY;
        } else if (fields[2] == "S") {
            cmd.side = Side::SELL;
        } else {
            return malformed("invalid side '" + std::string(fields[2]) + "'");
        }

        if (!parse_price(fields[3], price_decimals, cmd.price)) {
            return malformed("invalid price '" + std::string(fields[3]) + "'");
        }
        if (!parse_int(fields[4], cmd.quantity)) {
            return malformed("invalid quantity '" + std::string(fields[4]) + "'");
        }

        parsed.command = std::move(cmd);
    } else if (kind == "C") {
        if (fields.size() != 2) return malformed(wrong_arity(kind, 2, fields.size()));
        if (!is_valid_identifier(fields[1])) {
            return malformed("invalid order identifier '" + std::string(fields[1]) + "'");
        }
        parsed.command = CancelCommand{std::string(fields[1])};
    } else if (kind == "F") {
        if (fields.size() != 1) return malformed(wrong_arity(kind, 1, fields.size()));
        parsed.command = FlushCommand{};
    } else {
        return malformed("unknown command '" + std::string(kind) + "'");
    }

    return parsed;
}

std::string format_outcome(const Outcome& outcome, int price_decimals) {
    std::ostringstream oss;

    std::visit([&](const auto& record) {
        using T = std::decay_t<decltype(record)>;
        if constexpr (std::is_same_v<T, AckRecord>) {
            oss << "A, " << record.order_id << ", " << record.filled_quantity << ", "
                << record.resting_quantity;
        } else if constexpr (std::is_same_v<T, TradeRecord>) {
            oss << "T, " << record.taker_order_id << ", " << record.maker_order_id << ", "
                << format_price(record.price, price_decimals) << ", " << record.quantity;
        } else if constexpr (std::is_same_v<T, CancelledRecord>) {
            oss << "X, " << record.order_id;
        } else if constexpr (std::is_same_v<T, FlushedRecord>) {
            oss << "F";
        } else if constexpr (std::is_same_v<T, RejectedRecord>) {
            oss << "R, " << (record.order_id.empty() ? "-" : record.order_id) << ", "
                << to_string(record.reason);
        } else {
            static_assert(std::is_same_v<T, void>, "unhandled outcome record");
        }
    }, outcome);

    return oss.str();
}

} // namespace LimitBook
