#pragma once

#include <treemap_model/category.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace treemap_model {

// One filesystem entry in a scan result. Built once per scan and then only read.
struct TreemapNode {
    std::string name;
    std::string path;
    std::int64_t size = 0;
    FileTypeCategory category = FileTypeCategory::Other;
    std::vector<TreemapNode> children;
    int depth = 0;
    // Directory whose size is a placeholder estimate instead of a sum over its contents.
    bool approximate = false;

    bool has_children() const { return !children.empty(); }
};

TreemapNode make_leaf(std::string name, std::string path, std::int64_t size,
    FileTypeCategory category, int depth = 0);

// Size is the sum of the children; category is the dominant one.
TreemapNode make_directory(std::string name, std::string path,
    std::vector<TreemapNode> children, int depth = 0);

TreemapNode make_placeholder_directory(std::string name, std::string path,
    std::int64_t placeholder_size, int depth);

// Category with the greatest summed size; ties go to the earlier category, empty input to Other.
FileTypeCategory dominant_category(const std::vector<TreemapNode>& children);

std::size_t count_items(const TreemapNode& node);
int max_depth(const TreemapNode& node);

// "0 bytes", "1 byte", "512 bytes", "1.5 KB", "2.3 MB" (1000-based units).
std::string format_size(std::int64_t bytes);

} // namespace treemap_model
