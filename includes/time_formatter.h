#pragma once

#include <chrono>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace ntree {

class Config;

class TimeFormatter {
public:
    struct Options {
        // strftime(3) conversion string.
        std::string format;
    };

    TimeFormatter();
    explicit TimeFormatter(Options options);
    explicit TimeFormatter(const Config& config);

    std::string Format(std::chrono::system_clock::time_point time) const;

    static std::chrono::system_clock::time_point ToSystemTime(
        const std::filesystem::file_time_type& timestamp);
    static std::tm ToLocalTime(std::chrono::system_clock::time_point time);

    // Parses "YYYY-MM-DD" plus "HH:MM" or "HH:MM:SS" as local time.
    static std::optional<std::chrono::system_clock::time_point> ParseLocal(
        std::string_view date, std::string_view time);

private:
    std::string format_;
};

} // namespace ntree
