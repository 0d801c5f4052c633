#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "config.h"

namespace ntree {

class SizeFormatter {
public:
    struct Options {
        Config::SizeMode mode = Config::SizeMode::Off;
    };

    SizeFormatter() = default;
    explicit SizeFormatter(Options options);
    explicit SizeFormatter(const Config& config);

    // Text for the size column, padded to Width(). Empty when sizes are off.
    std::string Format(uintmax_t size) const;
    // Blank column used when the size could not be read.
    std::string Placeholder() const;
    std::size_t Width() const;

    static std::string FormatBytes(uintmax_t bytes);
    static std::string FormatHumanReadable(uintmax_t bytes);

private:
    inline static constexpr std::array<std::string_view, 7> kUnits{
        "", "K", "M", "G", "T", "P", "E"};
    static constexpr std::size_t kBytesWidth = 11;
    static constexpr std::size_t kHumanWidth = 5;

    Options options_{};
};

}  // namespace ntree
