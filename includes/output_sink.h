#pragma once

#include <filesystem>
#include <fstream>
#include <ostream>
#include <system_error>

namespace ntree {

// Single destination for tree lines and the summary: the console stream by
// default, or a file after open_file() succeeds.
class OutputSink {
public:
    OutputSink(std::ostream& console, bool console_is_terminal);

    OutputSink(const OutputSink&) = delete;
    OutputSink& operator=(const OutputSink&) = delete;

    // Truncates or creates `file`. On failure the sink keeps writing to the
    // console and the error is returned.
    [[nodiscard]] std::error_code open_file(const std::filesystem::path& file);

    [[nodiscard]] std::ostream& stream();
    // Whether colors may be emitted in auto mode.
    [[nodiscard]] bool interactive() const noexcept;
    [[nodiscard]] bool redirected() const noexcept { return redirected_; }

    // Returns an error when buffered output could not be written.
    [[nodiscard]] std::error_code flush();

private:
    std::ostream& console_;
    std::ofstream file_;
    bool console_is_terminal_;
    bool redirected_ = false;
};

}  // namespace ntree
