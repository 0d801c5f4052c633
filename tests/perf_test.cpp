#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <sstream>
#include <string>

#include "perf.h"

using ntree::perf::Manager;
using ntree::perf::Timer;

TEST(PerfTest, DisabledManagerRecordsNothing) {
    Manager& manager = Manager::Instance();
    manager.set_enabled(false);
    manager.IncrementCounter("fs::entries_read", 5);
    { Timer timer("fs::read_children"); }

    std::ostringstream out;
    manager.Report(out);
    ASSERT_TRUE(out.str().empty());
}

TEST(PerfTest, ReportListsTimersAndCountersByName) {
    Manager& manager = Manager::Instance();
    manager.set_enabled(true);
    manager.IncrementCounter("render::entries");
    manager.IncrementCounter("fs::entries_read", 3);
    manager.IncrementCounter("fs::entries_read", 2);
    manager.AddDuration("processor::process", std::chrono::milliseconds(4));
    manager.AddDuration("processor::process", std::chrono::milliseconds(2));

    std::ostringstream out;
    manager.Report(out);
    manager.set_enabled(false);

    const std::string report = out.str();
    ASSERT_EQ(report.rfind("ntree: perf:\n", 0), 0u);
    ASSERT_NE(report.find("  processor::process  calls=2 total=6.000ms slowest=4.000ms\n"), std::string::npos);
    auto fs_line = report.find("  fs::entries_read  5\n");
    auto render_line = report.find("  render::entries  1\n");
    ASSERT_NE(fs_line, std::string::npos);
    ASSERT_NE(render_line, std::string::npos);
    ASSERT_LT(fs_line, render_line);
}
