#pragma once

#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>

namespace LimitBook {

enum class LogLevel : uint8_t { DEBUG, INFO, WARN, ERROR };

const char* to_string(LogLevel level) noexcept;

/**
 * Synchronous diagnostic logger. Writes "[time] [LEVEL] message" lines to a
 * stream (stderr by default) so that stdout carries nothing but outcome records.
 * Messages below the threshold are dropped before any formatting happens.
 */
class Logger {
private:
    std::ostream* out_;
    LogLevel threshold_;

    void write(LogLevel level, const std::string& message);

public:
    explicit Logger(std::ostream& out_stream = std::cerr, LogLevel threshold = LogLevel::INFO) noexcept;

    void set_level(LogLevel threshold) noexcept { threshold_ = threshold; }
    LogLevel level() const noexcept { return threshold_; }
    void set_stream(std::ostream& out_stream) noexcept { out_ = &out_stream; }

    bool enabled(LogLevel level) const noexcept {
        return static_cast<uint8_t>(level) >= static_cast<uint8_t>(threshold_);
    }

    template <typename... Args>
    void log(LogLevel level, Args&&... args) {
        if (!enabled(level)) return;
        std::ostringstream oss;
        (oss << ... << std::forward<Args>(args));
        write(level, oss.str());
    }

    template <typename... Args>
    void debug(Args&&... args) {
        log(LogLevel::DEBUG, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(Args&&... args) {
        log(LogLevel::INFO, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(Args&&... args) {
        log(LogLevel::WARN, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(Args&&... args) {
        log(LogLevel::ERROR, std::forward<Args>(args)...);
    }
};

// Process-wide diagnostic sink
Logger& logger() noexcept;

} // namespace LimitBook
