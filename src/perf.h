#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <map>
#include <string>
#include <string_view>

namespace ntree::perf {

// Process-wide timings and counters behind --perf-debug. Recording is a no-op
// until set_enabled(true).
class Manager {
public:
    static Manager& Instance();

    // Also drops everything recorded so far.
    void set_enabled(bool enabled);
    [[nodiscard]] bool enabled() const { return enabled_; }

    void AddDuration(std::string_view label, std::chrono::steady_clock::duration duration);
    void IncrementCounter(std::string_view name, std::uint64_t delta = 1);

    // One line per timer (calls, total and slowest call in milliseconds) and
    // per counter, sorted by name.
    void Report(std::ostream& os) const;

private:
    Manager() = default;

    struct Timing {
        std::uint64_t calls = 0;
        std::chrono::steady_clock::duration total{};
        std::chrono::steady_clock::duration slowest{};
    };

    bool enabled_ = false;
    std::map<std::string, Timing, std::less<>> timings_;
    std::map<std::string, std::uint64_t, std::less<>> counters_;
};

// Adds the time between construction and destruction under `label`.
class Timer {
public:
    explicit Timer(std::string label);
    ~Timer();

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

private:
    std::string label_;
    std::chrono::steady_clock::time_point start_;
};

}  // namespace ntree::perf
