#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "renderer.h"
#include "test_support.h"

using ntree::Config;
using ntree::Entry;
using ntree::EntryKind;
using ntree::Renderer;
using ntree::Summary;
using ntree::Theme;
using ntree::testing::MakeEntry;
namespace fs = std::filesystem;

TEST(RendererTest, PrefixUsesTeeCornerAndVerticalGlyphs) {
    Config config;
    Theme theme;
    std::ostringstream out;
    Renderer renderer(config, theme, out);

    ASSERT_EQ(renderer.TreePrefix({}, false), "├── ");
    ASSERT_EQ(renderer.TreePrefix({}, true), "└── ");
    ASSERT_EQ(renderer.TreePrefix({true, false}, true), "│       └── ");
}

TEST(RendererTest, AsciiGlyphs) {
    Config config;
    config.set_ascii(true);
    Theme theme;
    std::ostringstream out;
    Renderer renderer(config, theme, out);

    ASSERT_EQ(renderer.TreePrefix({true}, false), "|   |-- ");
    ASSERT_EQ(renderer.TreePrefix({false}, true), "    `-- ");
}

TEST(RendererTest, EntryLineWithSymlinkAndAnnotation) {
    Config config;
    Theme theme;
    std::ostringstream out;
    Renderer renderer(config, theme, out);

    Entry link = MakeEntry("up");
    link.info.kind = EntryKind::Symlink;
    link.info.is_dir = true;
    link.info.symlink_target = "..";
    link.info.has_symlink_target = true;
    link.is_last = true;
    renderer.RenderEntry(link, {false}, "[recursive, not followed]");
    ASSERT_EQ(out.str(), "    └── up -> .. [recursive, not followed]\n");
}

TEST(RendererTest, NoIndentAndFullPathDropThePrefix) {
    Config config;
    config.set_full_path(true);
    Theme theme;
    std::ostringstream out;
    Renderer renderer(config, theme, out);

    Entry entry = MakeEntry("c.txt");
    entry.info.path = fs::path("root") / "a" / "c.txt";
    renderer.RenderEntry(entry, {true});
    ASSERT_EQ(out.str(), "root/a/c.txt\n");

    Config plain;
    plain.set_no_indent(true);
    std::ostringstream plain_out;
    Renderer plain_renderer(plain, theme, plain_out);
    plain_renderer.RenderEntry(entry, {true});
    ASSERT_EQ(plain_out.str(), "c.txt\n");
}

TEST(RendererTest, DecorationsAppearInFixedOrder) {
    Config config;
    config.set_show_permissions(true);
    config.set_show_owner(true);
    config.set_size_mode(Config::SizeMode::Bytes);
    Theme theme;
    std::ostringstream out;
    Renderer renderer(config, theme, out);

    Entry entry = MakeEntry("data.bin");
    entry.info.perms = fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read |
                       fs::perms::others_read;
    entry.info.has_perms = true;
    entry.info.owner = "alice";
    entry.info.size = 1234;
    entry.info.has_size = true;
    entry.is_last = true;

    ASSERT_EQ(renderer.Decorations(entry.info), "[-rw-r--r-- alice           1234]  ");
    renderer.RenderEntry(entry, {});
    ASSERT_EQ(out.str(), "└── [-rw-r--r-- alice           1234]  data.bin\n");
}

TEST(RendererTest, MissingMetadataRendersAsBlankPadding) {
    Config config;
    config.set_show_permissions(true);
    config.set_size_mode(Config::SizeMode::Human);
    Theme theme;
    std::ostringstream out;
    Renderer renderer(config, theme, out);

    Entry entry = MakeEntry("mystery");
    ASSERT_EQ(renderer.Decorations(entry.info), "[" + std::string(10, ' ') + " " + std::string(5, ' ') + "]  ");
}

TEST(RendererTest, ClassifyIndicators) {
    Config config;
    config.set_classify(true);
    config.set_no_indent(true);
    Theme theme;
    std::ostringstream out;
    Renderer renderer(config, theme, out);

    Entry dir = MakeEntry("bin", true);
    Entry tool = MakeEntry("run");
    tool.info.is_exec = true;
    Entry sock = MakeEntry("agent");
    sock.info.kind = EntryKind::Socket;
    Entry fifo = MakeEntry("pipe");
    fifo.info.kind = EntryKind::Fifo;
    Entry plain = MakeEntry("notes");

    for (const auto* entry : {&dir, &tool, &sock, &fifo, &plain}) {
        renderer.RenderEntry(*entry, {});
    }
    ASSERT_EQ(out.str(), "bin/\nrun*\nagent=\npipe|\nnotes\n");
}

TEST(RendererTest, ColorsNamesAndPrefixWhenEnabled) {
    Config config;
    config.set_no_color(false);
    Theme theme;
    theme.mutable_colors().set("tree", "\x1b[90m");
    std::ostringstream out;
    Renderer renderer(config, theme, out);

    Entry dir = MakeEntry("src", true);
    dir.is_last = true;
    renderer.RenderEntry(dir, {});
    ASSERT_EQ(out.str(), "\x1b[90m└── \x1b[0m\x1b[1;34msrc\x1b[0m\n");
}

TEST(RendererTest, SummaryPluralization) {
    Config config;
    Theme theme;
    std::ostringstream out;
    Renderer renderer(config, theme, out);

    renderer.RenderSummary(Summary{1, 2});
    renderer.RenderSummary(Summary{3, 1});
    ASSERT_EQ(out.str(), "\n1 directory, 2 files\n\n3 directories, 1 file\n");

    Config dirs_only;
    dirs_only.set_dirs_only(true);
    std::ostringstream dirs_out;
    Renderer dirs_renderer(dirs_only, theme, dirs_out);
    dirs_renderer.RenderSummary(Summary{0, 0});
    ASSERT_EQ(dirs_out.str(), "\n0 directories\n");
}

TEST(RendererTest, RootLineKeepsItsLabel) {
    Config config;
    Theme theme;
    std::ostringstream out;
    Renderer renderer(config, theme, out);

    Entry root = MakeEntry("../project", true);
    renderer.RenderRoot(root, "[error opening dir]");
    ASSERT_EQ(out.str(), "../project [error opening dir]\n");
}
