#include "size_formatter.h"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>

namespace ntree {

SizeFormatter::SizeFormatter(Options options)
    : options_(options) {}

SizeFormatter::SizeFormatter(const Config& config)
    : SizeFormatter(Options{.mode = config.size_mode()}) {}

std::size_t SizeFormatter::Width() const {
    switch (options_.mode) {
        case Config::SizeMode::Bytes:
            return kBytesWidth;
        case Config::SizeMode::Human:
            return kHumanWidth;
        case Config::SizeMode::Off:
            break;
    }
    return 0;
}

std::string SizeFormatter::Format(uintmax_t size) const {
    if (options_.mode == Config::SizeMode::Off) {
        return {};
    }
    std::string text = options_.mode == Config::SizeMode::Human ? FormatHumanReadable(size)
                                                                : FormatBytes(size);
    std::ostringstream out;
    out << std::setw(static_cast<int>(Width())) << std::right << text;
    return out.str();
}

std::string SizeFormatter::Placeholder() const {
    return std::string(Width(), ' ');
}

std::string SizeFormatter::FormatBytes(uintmax_t bytes) {
    return std::to_string(bytes);
}

std::string SizeFormatter::FormatHumanReadable(uintmax_t bytes) {
    constexpr double kBase = 1024.0;
    double value = static_cast<double>(bytes);
    std::size_t unit_index = 0;
    while (value >= kBase && unit_index + 1 < kUnits.size()) {
        value /= kBase;
        ++unit_index;
    }

    // Rounding never promotes the unit: 1023.6K prints as 1024K.
    auto rounded = static_cast<uintmax_t>(std::llround(value));
    std::string result = std::to_string(rounded);
    result.append(kUnits[unit_index]);
    return result;
}

}  // namespace ntree
