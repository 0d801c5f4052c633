#include "perf.h"

#include <iomanip>
#include <ostream>
#include <utility>

namespace ntree::perf {

namespace {

double Milliseconds(std::chrono::steady_clock::duration duration) {
    return std::chrono::duration<double, std::milli>(duration).count();
}

}  // namespace

Manager& Manager::Instance() {
    static Manager manager;
    return manager;
}

void Manager::set_enabled(bool enabled) {
    enabled_ = enabled;
    timings_.clear();
    counters_.clear();
}

void Manager::AddDuration(std::string_view label, std::chrono::steady_clock::duration duration) {
    if (!enabled_) {
        return;
    }
    auto it = timings_.find(label);
    if (it == timings_.end()) {
        it = timings_.emplace(std::string(label), Timing{}).first;
    }
    Timing& timing = it->second;
    ++timing.calls;
    timing.total += duration;
    if (duration > timing.slowest) {
        timing.slowest = duration;
    }
}

void Manager::IncrementCounter(std::string_view name, std::uint64_t delta) {
    if (!enabled_) {
        return;
    }
    auto it = counters_.find(name);
    if (it == counters_.end()) {
        counters_.emplace(std::string(name), delta);
        return;
    }
    it->second += delta;
}

void Manager::Report(std::ostream& os) const {
    if (!enabled_ || (timings_.empty() && counters_.empty())) {
        return;
    }

    std::ios_base::fmtflags flags = os.flags();
    std::streamsize precision = os.precision();
    os << std::fixed << std::setprecision(3);
    os << "ntree: perf:\n";
    for (const auto& [label, timing] : timings_) {
        os << "  " << label << "  calls=" << timing.calls << " total=" << Milliseconds(timing.total)
           << "ms slowest=" << Milliseconds(timing.slowest) << "ms\n";
    }
    for (const auto& [name, value] : counters_) {
        os << "  " << name << "  " << value << '\n';
    }
    os.flags(flags);
    os.precision(precision);
}

Timer::Timer(std::string label)
    : label_(std::move(label)),
      start_(std::chrono::steady_clock::now()) {}

Timer::~Timer() {
    Manager::Instance().AddDuration(label_, std::chrono::steady_clock::now() - start_);
}

}  // namespace ntree::perf
