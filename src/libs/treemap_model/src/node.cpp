#include <treemap_model/types.hpp>
#include <algorithm>
#include <array>
#include <cstdio>
#include <iterator>
#include <utility>

namespace treemap_model {

TreemapNode make_leaf(std::string name, std::string path, std::int64_t size,
    FileTypeCategory category, int depth)
{
    TreemapNode node;
    node.name = std::move(name);
    node.path = std::move(path);
    node.size = size;
    node.category = category;
    node.depth = depth;
    return node;
}

TreemapNode make_directory(std::string name, std::string path,
    std::vector<TreemapNode> children, int depth)
{
    TreemapNode node;
    node.name = std::move(name);
    node.path = std::move(path);
    node.depth = depth;
    for (const auto& c : children)
        node.size += c.size;
    node.category = dominant_category(children);
    node.children = std::move(children);
    return node;
}

TreemapNode make_placeholder_directory(std::string name, std::string path,
    std::int64_t placeholder_size, int depth)
{
    TreemapNode node = make_leaf(std::move(name), std::move(path), placeholder_size,
        FileTypeCategory::System, depth);
    node.approximate = true;
    return node;
}

FileTypeCategory dominant_category(const std::vector<TreemapNode>& children) {
    if (children.empty()) return FileTypeCategory::Other;

    std::array<std::int64_t, category_count> totals{};
    std::array<bool, category_count> present{};
    for (const auto& c : children) {
        totals[category_index(c.category)] += c.size;
        present[category_index(c.category)] = true;
    }

    FileTypeCategory best = FileTypeCategory::Other;
    bool found = false;
    std::int64_t best_total = 0;
    for (FileTypeCategory category : all_categories()) {
        const std::size_t i = category_index(category);
        if (!present[i]) continue;
        if (!found || totals[i] > best_total) {
            best = category;
            best_total = totals[i];
            found = true;
        }
    }
    return best;
}

std::size_t count_items(const TreemapNode& node) {
    if (!node.has_children()) return 1;
    std::size_t total = 0;
    for (const auto& c : node.children)
        total += count_items(c);
    return total;
}

int max_depth(const TreemapNode& node) {
    if (!node.has_children()) return 0;
    int deepest = 0;
    for (const auto& c : node.children)
        deepest = std::max(deepest, max_depth(c));
    return 1 + deepest;
}

std::string format_size(std::int64_t bytes) {
    if (bytes == 1) return "1 byte";
    if (bytes < 1000 && bytes > -1000) return std::to_string(bytes) + " bytes";

    static const char* units[] = { "KB", "MB", "GB", "TB", "PB", "EB" };
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    value /= 1000.0;
    while ((value >= 1000.0 || value <= -1000.0) && unit + 1 < std::size(units)) {
        value /= 1000.0;
        ++unit;
    }

    char buf[32];
    if (value >= 100.0 || value <= -100.0)
        (void)std::snprintf(buf, sizeof(buf), "%.0f %s", value, units[unit]);
    else
        (void)std::snprintf(buf, sizeof(buf), "%.1f %s", value, units[unit]);
    return buf;
}

} // namespace treemap_model
