#pragma once

#include <memory>
#include <ostream>

#include <CLI/CLI.hpp>

#include "config.h"

namespace ntree {

class CommandLineParser {
public:
    CommandLineParser();
    ~CommandLineParser();

    // Throws CLI::ParseError on invalid input and for --help / --version.
    Config Parse(int argc, const char* const* argv);

    // Prints the help, version or diagnostic for `error` and returns the
    // process exit code.
    int Exit(const CLI::ParseError& error, std::ostream& out, std::ostream& err) const;

private:
    std::unique_ptr<CLI::App> program_;
};

} // namespace ntree
