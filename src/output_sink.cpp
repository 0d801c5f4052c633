#include "output_sink.h"

#include <cerrno>

#include "logger.h"

namespace ntree {

OutputSink::OutputSink(std::ostream& console, bool console_is_terminal)
    : console_(console),
      console_is_terminal_(console_is_terminal) {}

std::error_code OutputSink::open_file(const std::filesystem::path& file) {
    errno = 0;
    file_.open(file, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file_.is_open()) {
        const int err = errno != 0 ? errno : EIO;
        return std::error_code(err, std::generic_category());
    }
    redirected_ = true;
    Logger::instance().debug("writing output to ", file.string());
    return {};
}

std::ostream& OutputSink::stream() {
    if (redirected_) {
        return file_;
    }
    return console_;
}

bool OutputSink::interactive() const noexcept {
    return !redirected_ && console_is_terminal_;
}

std::error_code OutputSink::flush() {
    std::ostream& out = stream();
    out.flush();
    if (!out) {
        return std::make_error_code(std::errc::io_error);
    }
    return {};
}

}  // namespace ntree
