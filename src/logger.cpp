#include "logger.h"

#include <iostream>

namespace ntree {

namespace {

std::string_view LevelLabel(Logger::Level level)
{
    switch (level) {
        case Logger::Level::Error:
            return "error";
        case Logger::Level::Warning:
            return "warning";
        case Logger::Level::Info:
            return "info";
        case Logger::Level::Debug:
            return "debug";
        case Logger::Level::Trace:
            return "trace";
    }
    return "log";
}

} // namespace

Logger::Logger()
    : stream_(&std::cerr),
      level_(Level::Warning) {}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(Level level) noexcept { level_.store(level, std::memory_order_relaxed); }

Logger::Level Logger::level() const noexcept { return level_.load(std::memory_order_relaxed); }

void Logger::set_output_stream(std::ostream* stream) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_ = stream != nullptr ? stream : &std::cerr;
}

void Logger::write(Level level, std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    *stream_ << "ntree: " << LevelLabel(level) << ": " << message << '\n';
}

} // namespace ntree
