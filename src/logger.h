#pragma once

#include <atomic>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string_view>
#include <utility>

namespace ntree {

class Logger {
public:
    enum class Level {
        Error = 0,
        Warning,
        Info,
        Debug,
        Trace
    };

    static Logger& instance();

    void set_level(Level level) noexcept;
    Level level() const noexcept;

    [[nodiscard]] bool enabled(Level level) const noexcept { return level <= this->level(); }

    template <typename... Args>
    void log(Level level, Args&&... args) {
        if (!enabled(level)) {
            return;
        }
        std::ostringstream message;
        (message << ... << std::forward<Args>(args));
        write(level, message.str());
    }

    template <typename... Args>
    void trace(Args&&... args) {
        log(Level::Trace, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(Args&&... args) {
        log(Level::Debug, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(Args&&... args) {
        log(Level::Info, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(Args&&... args) {
        log(Level::Warning, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(Args&&... args) {
        log(Level::Error, std::forward<Args>(args)...);
    }

    // Passing nullptr restores std::cerr.
    void set_output_stream(std::ostream* stream) noexcept;

private:
    Logger();
    void write(Level level, std::string_view message);

    std::ostream* stream_;
    std::atomic<Level> level_;
    std::mutex mutex_;
};

} // namespace ntree
