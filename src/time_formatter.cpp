#include "time_formatter.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string_view>
#include <utility>

#include "config.h"

namespace ntree {

TimeFormatter::TimeFormatter()
    : TimeFormatter(Options{Config::kDefaultTimeFormat}) {}

TimeFormatter::TimeFormatter(Options options)
    : format_(std::move(options.format)) {
    if (format_.empty()) {
        format_ = Config::kDefaultTimeFormat;
    }
}

TimeFormatter::TimeFormatter(const Config& config)
    : TimeFormatter(Options{.format = config.time_format()}) {}

std::chrono::system_clock::time_point TimeFormatter::ToSystemTime(
    const std::filesystem::file_time_type& timestamp) {
    using namespace std::chrono;
    return time_point_cast<system_clock::duration>(
        timestamp - std::filesystem::file_time_type::clock::now() + system_clock::now());
}

std::tm TimeFormatter::ToLocalTime(std::chrono::system_clock::time_point time) {
    const std::time_t time_value = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &time_value);
#else
    localtime_r(&time_value, &tm);
#endif
    return tm;
}

std::string TimeFormatter::Format(std::chrono::system_clock::time_point time) const {
    std::tm tm = ToLocalTime(time);
    char buffer[256]{};
    if (std::strftime(buffer, sizeof(buffer), format_.c_str(), &tm) == 0) {
        if (std::strftime(buffer, sizeof(buffer), Config::kDefaultTimeFormat, &tm) == 0) {
            return {};
        }
    }
    return std::string(buffer);
}

std::optional<std::chrono::system_clock::time_point> TimeFormatter::ParseLocal(
    std::string_view date, std::string_view time) {
    std::string text(date);
    text.push_back(' ');
    text.append(time);

    std::tm tm{};
    std::istringstream in(text);
    in >> std::get_time(&tm, "%Y-%m-%d %H:%M");
    if (in.fail()) {
        return std::nullopt;
    }
    if (in.peek() == ':') {
        in.get();
        int seconds = 0;
        if (!(in >> seconds) || seconds < 0 || seconds > 60) {
            return std::nullopt;
        }
        tm.tm_sec = seconds;
    }
    tm.tm_isdst = -1;
    std::time_t value = std::mktime(&tm);
    if (value == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(value);
}

}  // namespace ntree
