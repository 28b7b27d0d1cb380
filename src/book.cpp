#include "book.hpp"

namespace LimitBook {

Book::Book(OrderPool& pool) noexcept
    : pool_(pool) {}

void Book::rest(OrderHandle handle) {
    const Order& order = pool_.get(handle);

    if (order.side == Side::BUY) {
        auto it = bid_levels_.try_emplace(order.price, order.price).first;
        it->second.add_order(pool_, handle);
    } else {
        auto it = ask_levels_.try_emplace(order.price, order.price).first;
        it->second.add_order(pool_, handle);
    }
}

PriceLevel* Book::best(Side side) noexcept {
    if (side == Side::BUY) {
        return bid_levels_.empty() ? nullptr : &bid_levels_.begin()->second;
    }
    return ask_levels_.empty() ? nullptr : &ask_levels_.begin()->second;
}

const PriceLevel* Book::best(Side side) const noexcept {
    if (side == Side::BUY) {
        return bid_levels_.empty() ? nullptr : &bid_levels_.begin()->second;
    }
    return ask_levels_.empty() ? nullptr : &ask_levels_.begin()->second;
}

template <typename Ladder>
OrderHandle Book::pop_front_from(Ladder& ladder, Price price) {
    auto it = ladder.find(price);
    if (it == ladder.end() || it->second.empty()) {
        throw InvariantViolation("pop from missing level at price " + std::to_string(price));
    }

    PriceLevel& level = it->second;
    const OrderHandle handle = level.front();
    level.remove_order(pool_, handle);
    if (level.empty()) {
        ladder.erase(it);
    }
    return handle;
}

OrderHandle Book::pop_front(Side side, Price price) {
    if (side == Side::BUY) {
        return pop_front_from(bid_levels_, price);
    }
    return pop_front_from(ask_levels_, price);
}

template <typename Ladder>
void Book::remove_from(Ladder& ladder, OrderHandle handle) {
    const Order& order = pool_.get(handle);
    auto it = ladder.find(order.price);
    if (it == ladder.end()) {
        throw InvariantViolation("order " + order.order_id + " has no level at price " +
                                 std::to_string(order.price));
    }

    PriceLevel& level = it->second;
    level.remove_order(pool_, handle);
    if (level.empty()) {
        ladder.erase(it);
    }
}

void Book::remove(OrderHandle handle) {
    if (pool_.get(handle).side == Side::BUY) {
        remove_from(bid_levels_, handle);
    } else {
        remove_from(ask_levels_, handle);
    }
}

void Book::clear() noexcept {
    bid_levels_.clear();
    ask_levels_.clear();
}

Price Book::best_bid() const noexcept {
    return bid_levels_.empty() ? NO_PRICE : bid_levels_.begin()->first;
}

Price Book::best_ask() const noexcept {
    return ask_levels_.empty() ? NO_PRICE : ask_levels_.begin()->first;
}

bool Book::is_crossed() const noexcept {
    if (bid_levels_.empty() || ask_levels_.empty()) return false;
    return best_bid() >= best_ask();
}

uint64_t Book::level_count(Side side) const noexcept {
    return side == Side::BUY ? bid_levels_.size() : ask_levels_.size();
}

uint64_t Book::order_count(Side side) const noexcept {
    uint64_t count = 0;
    if (side == Side::BUY) {
        for (const auto& [price, level] : bid_levels_) count += level.order_count;
    } else {
        for (const auto& [price, level] : ask_levels_) count += level.order_count;
    }
    return count;
}

uint64_t Book::volume(Side side) const noexcept {
    uint64_t total = 0;
    if (side == Side::BUY) {
        for (const auto& [price, level] : bid_levels_) total += level.total_volume;
    } else {
        for (const auto& [price, level] : ask_levels_) total += level.total_volume;
    }
    return total;
}

bool Book::empty() const noexcept {
    return bid_levels_.empty() && ask_levels_.empty();
}

} // namespace LimitBook
