#include "app.h"

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>

#include "fs_scanner.h"
#include "listing_reader.h"
#include "logger.h"
#include "path_processor.h"
#include "perf.h"
#include "platform.h"
#include "renderer.h"
#include "resources.h"
#include "theme.h"

namespace fs = std::filesystem;

namespace ntree {

App::App()
    : App(std::cout, std::cerr, std::cin, Platform::isOutputTerminal()) {}

App::App(std::ostream& out, std::ostream& err, std::istream& in, bool out_is_terminal)
    : out_(out),
      err_(err),
      in_(in),
      out_is_terminal_(out_is_terminal) {}

App::~App() {
    Logger::instance().set_output_stream(nullptr);
}

int App::run(int argc, const char* const* argv) {
    virtual_terminal_enabled_ = Platform::enableVirtualTerminal();

    Config config;
    try {
        config = parser_.Parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return parser_.Exit(e, out_, err_);
    }
    return runWith(config, argc > 0 ? argv[0] : nullptr);
}

void App::resolveColor(Config& config, const OutputSink& sink) const {
    const bool no_color_env = std::getenv("NO_COLOR") != nullptr;
    const bool terminal = sink.interactive() && virtual_terminal_enabled_;
    config.set_no_color(!Theme::ShouldColorize(config.color_mode(), terminal, no_color_env));
}

bool App::makeSource(const Config& config, std::unique_ptr<PathSource>& source) {
    if (!config.from_file()) {
        source = std::make_unique<FileScanner>(config, ownership_resolver_, symlink_resolver_);
        return true;
    }

    const std::string listing = config.paths().empty() ? std::string("-") : config.paths().front();
    if (listing == "-" || listing == ".") {
        source = std::make_unique<ListingReader>(in_, ".");
        return true;
    }

    auto file = std::make_unique<std::ifstream>(fs::path(listing));
    if (!file->is_open()) {
        std::error_code ec(errno != 0 ? errno : ENOENT, std::generic_category());
        err_ << "ntree: " << listing << ": " << ec.message() << '\n';
        return false;
    }
    source = std::make_unique<ListingReader>(*file, listing);
    listing_stream_ = std::move(file);
    return true;
}

int App::runWith(Config& config, const char* argv0) {
    Logger::instance().set_output_stream(&err_);
    Logger::instance().set_level(config.log_level());

    perf::Manager& perf_manager = perf::Manager::Instance();
    perf_manager.set_enabled(config.perf_logging());
    std::optional<perf::Timer> run_timer;
    if (perf_manager.enabled()) {
        run_timer.emplace("app::run");
    }

    OutputSink sink(out_, out_is_terminal_);
    if (const auto& output = config.output_file()) {
        if (auto ec = sink.open_file(*output)) {
            err_ << "ntree: " << *output << ": " << ec.message() << '\n';
            return static_cast<int>(VisitResult::Serious);
        }
    }
    resolveColor(config, sink);

    Theme theme;
    if (const auto& name = config.theme_name()) {
        theme.LoadNamed(*name, ResourceLocator(argv0).databaseCandidates());
    }
    if (const char* ls_colors = std::getenv("LS_COLORS")) {
        theme.ApplyLsColors(ls_colors);
    }

    std::unique_ptr<PathSource> source;
    if (!makeSource(config, source)) {
        return static_cast<int>(VisitResult::Serious);
    }

    Renderer renderer(config, theme, sink.stream());
    PathProcessor processor(config, *source, renderer, err_);

    VisitResult rc = VisitResult::Ok;
    for (const auto& root : source->roots()) {
        VisitResult root_result = VisitResult::Ok;
        try {
            root_result = processor.process(root);
        } catch (const std::exception& e) {
            err_ << "ntree: error: " << root.string() << ": " << e.what() << '\n';
            root_result = VisitResult::Serious;
        }
        rc = VisitResultAggregator::Combine(rc, root_result);
    }

    if (!config.no_report()) {
        renderer.RenderSummary(processor.summary());
    }
    if (auto ec = sink.flush()) {
        err_ << "ntree: write error: " << ec.message() << '\n';
        rc = VisitResultAggregator::Combine(rc, VisitResult::Serious);
    }

    if (perf_manager.enabled()) {
        run_timer.reset();
        perf_manager.Report(err_);
    }
    return static_cast<int>(rc);
}

}  // namespace ntree
