#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <vector>

#include "path_source.h"

namespace ntree {

// Path source that rebuilds a hierarchy from a flat listing, one path per
// line. Understands plain paths (a trailing '/' marks a directory) and
// `tar -tvf` output. Missing intermediate directories are synthesized.
class ListingReader : public PathSource {
public:
    enum class Format {
        Simple,
        Tar
    };

    // Reads the whole stream up front. `root_label` is the name printed on the
    // root line and the prefix used for full paths.
    ListingReader(std::istream& in, std::string root_label);

    [[nodiscard]] Format format() const noexcept { return format_; }
    [[nodiscard]] std::size_t node_count() const noexcept { return nodes_.size(); }

    [[nodiscard]] std::vector<std::filesystem::path> roots() const override;
    [[nodiscard]] std::error_code open_root(const std::filesystem::path& root, Entry& out) override;
    [[nodiscard]] std::error_code read_children(const Entry& dir, std::vector<Entry>& out) override;
    [[nodiscard]] bool traversable(const Entry& entry) const override;
    [[nodiscard]] std::optional<std::filesystem::path> real_path(const Entry& entry) const override;

    static bool LooksLikeTarListing(const std::vector<std::string>& lines);

private:
    struct Node {
        FileInfo info;
        std::vector<std::size_t> children;
        std::unordered_map<std::string, std::size_t> child_index;
    };

    void parse(const std::vector<std::string>& lines);
    void add_simple_line(std::string_view line);
    bool add_tar_line(std::string_view line);
    // Creates every missing segment of `relative` and returns the final node.
    std::optional<std::size_t> insert(std::string_view relative, bool is_dir);
    std::size_t child_of(std::size_t parent, const std::string& name);
    void promote_to_directory(std::size_t index);

    std::string root_label_;
    Format format_ = Format::Simple;
    std::vector<Node> nodes_;
    // generic_string() of a node's path to its index.
    std::unordered_map<std::string, std::size_t> by_path_;
};

}  // namespace ntree
