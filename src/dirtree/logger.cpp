#include "dirtree/logger.hpp"

#include <iostream>

namespace dirtree {

namespace {
Logger* g_instance = nullptr;
std::once_flag g_logger_once;
}

Logger::Logger()
    : stream_(&std::clog)
    , level_(Level::Warning) {}

Logger& Logger::instance() {
    std::call_once(g_logger_once, [] { g_instance = new Logger(); });
    return *g_instance;
}

void Logger::set_level(Level level) noexcept {
    level_ = level;
}

Logger::Level Logger::level() const noexcept {
    return level_;
}

void Logger::set_output(std::ostream* stream) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_ = stream;
}

std::string_view Logger::level_to_string(Level level) noexcept {
    switch (level) {
    case Level::Error:
        return "ERROR";
    case Level::Warning:
        return "WARN";
    case Level::Info:
        return "INFO";
    case Level::Debug:
        return "DEBUG";
    case Level::Trace:
        return "TRACE";
    }
    return "UNKNOWN";
}

void Logger::write(Level level, std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!stream_) {
        return;
    }
    *stream_ << '[' << level_to_string(level) << "] " << message << '\n';
}

} // namespace dirtree
