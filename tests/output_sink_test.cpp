#include <gtest/gtest.h>

#include <fstream>
#include <iterator>
#include <sstream>
#include <string>

#include "output_sink.h"
#include "test_support.h"

using ntree::OutputSink;
using ntree::testing::TempDir;

namespace {

std::string ReadAll(const std::filesystem::path& file) {
    std::ifstream in(file, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

}  // namespace

TEST(OutputSinkTest, WritesToConsoleByDefault) {
    std::ostringstream console;
    OutputSink sink(console, true);
    sink.stream() << ".\n";
    EXPECT_FALSE(sink.flush());
    ASSERT_EQ(console.str(), ".\n");
    ASSERT_TRUE(sink.interactive());
    ASSERT_FALSE(sink.redirected());
}

TEST(OutputSinkTest, FileReplacesConsole) {
    TempDir dir;
    auto file = dir.WriteFile("tree.txt", "stale content that must disappear");

    std::ostringstream console;
    OutputSink sink(console, true);
    ASSERT_FALSE(sink.open_file(file));
    sink.stream() << ".\n\n0 directories, 0 files\n";
    ASSERT_FALSE(sink.flush());

    ASSERT_TRUE(console.str().empty());
    ASSERT_EQ(ReadAll(file), ".\n\n0 directories, 0 files\n");
    ASSERT_TRUE(sink.redirected());
    ASSERT_FALSE(sink.interactive());
}

TEST(OutputSinkTest, UnopenableFileKeepsConsole) {
    TempDir dir;
    std::ostringstream console;
    OutputSink sink(console, false);

    std::error_code ec = sink.open_file(dir.path() / "missing" / "tree.txt");
    ASSERT_TRUE(ec);
    ASSERT_FALSE(sink.redirected());

    sink.stream() << "still here\n";
    ASSERT_EQ(console.str(), "still here\n");
    ASSERT_FALSE(sink.interactive());
}

TEST(OutputSinkTest, FlushReportsStreamFailure) {
    std::ostringstream console;
    console.setstate(std::ios::badbit);
    OutputSink sink(console, false);
    ASSERT_EQ(sink.flush(), std::make_error_code(std::errc::io_error));
}
