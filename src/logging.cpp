#include "logging.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>

namespace LimitBook {

const char* to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

Logger::Logger(std::ostream& out_stream, LogLevel threshold) noexcept
    : out_(&out_stream), threshold_(threshold) {}

void Logger::write(LogLevel level, const std::string& message) {
    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);

    (*out_) << "[" << std::put_time(&tm, "%F %T") << "] [" << to_string(level) << "] "
            << message << "\n";
    out_->flush();
}

Logger& logger() noexcept {
    static Logger instance;
    return instance;
}

} // namespace LimitBook
