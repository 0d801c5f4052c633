#pragma once

#include <iostream>
#include <memory>

#include "command_line_parser.h"
#include "config.h"
#include "file_ownership_resolver.h"
#include "output_sink.h"
#include "path_source.h"
#include "symlink_resolver.h"

namespace ntree {

class App {
public:
    // Uses the process standard streams.
    App();
    // Streams are borrowed; `out_is_terminal` drives automatic coloring.
    App(std::ostream& out, std::ostream& err, std::istream& in, bool out_is_terminal);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    int run(int argc, const char* const* argv);

private:
    int runWith(Config& config, const char* argv0);
    void resolveColor(Config& config, const OutputSink& sink) const;
    // Builds the path source; returns false after reporting when the listing
    // file cannot be opened.
    bool makeSource(const Config& config, std::unique_ptr<PathSource>& source);

    std::ostream& out_;
    std::ostream& err_;
    std::istream& in_;
    bool out_is_terminal_;
    bool virtual_terminal_enabled_ = true;

    CommandLineParser parser_{};
    FileOwnershipResolver ownership_resolver_{};
    SymlinkResolver symlink_resolver_{};
    std::unique_ptr<std::istream> listing_stream_{};
};

}  // namespace ntree
