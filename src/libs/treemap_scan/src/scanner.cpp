#include <treemap_scan/scanner.hpp>
#include <treemap_model/category.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <string>
#include <system_error>
#include <unordered_set>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace treemap_scan {

namespace {

struct ScanContext {
    const ScanOptions& options;
    const CancellationFlag& cancel;
    ScanStats stats;
    std::unordered_set<std::string> visited;
};

std::string display_name(const fs::path& path) {
    fs::path p = path;
    if (!p.has_filename() && p.has_parent_path() && p.parent_path() != p)
        p = p.parent_path();
    std::string name = p.filename().string();
    if (name.empty()) name = path.string();
    return name;
}

bool is_hidden(const std::string& name) {
    return !name.empty() && name.front() == '.';
}

// Directory already on the traversal (symlink loop or bind mount).
bool mark_visited(const fs::path& dir, ScanContext& context) {
    std::error_code ec;
    const fs::path canonical = fs::canonical(dir, ec);
    if (ec) return true;
    return context.visited.insert(canonical.string()).second;
}

std::vector<treemap_model::TreemapNode> scan_directory(const fs::path& dir, int depth, ScanContext& context);

treemap_model::TreemapNode scan_entry(const fs::path& entry_path, const std::string& name,
    const fs::file_status& status, int depth, ScanContext& context, bool& ok)
{
    ok = true;
    if (fs::is_directory(status)) {
        if (depth < context.options.max_depth) {
            auto children = scan_directory(entry_path, depth, context);
            return treemap_model::make_directory(name, entry_path.string(), std::move(children), depth);
        }
        return treemap_model::make_placeholder_directory(name, entry_path.string(),
            context.options.directory_placeholder_size, depth);
    }

    std::error_code ec;
    const std::uintmax_t size = fs::file_size(entry_path, ec);
    if (ec) {
        spdlog::debug("scan: cannot size {}: {}", entry_path.string(), ec.message());
        ok = false;
        return {};
    }
    const std::string ext = entry_path.extension().string();
    return treemap_model::make_leaf(name, entry_path.string(), static_cast<std::int64_t>(size),
        treemap_model::classify_extension(ext), depth);
}

std::vector<treemap_model::TreemapNode> scan_directory(const fs::path& dir, int depth, ScanContext& context) {
    std::vector<treemap_model::TreemapNode> nodes;
    if (context.cancel.is_cancelled()) return nodes;
    if (!mark_visited(dir, context)) {
        spdlog::debug("scan: {} already visited, not descending", dir.string());
        return nodes;
    }

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        spdlog::debug("scan: cannot enumerate {}: {}", dir.string(), ec.message());
        ++context.stats.directories_failed;
        return nodes;
    }

    const int child_depth = depth + 1;
    std::size_t considered = 0;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            spdlog::debug("scan: enumeration of {} stopped: {}", dir.string(), ec.message());
            ++context.stats.directories_failed;
            break;
        }
        if (context.cancel.is_cancelled()) break;

        const fs::path entry_path = it->path();
        const std::string name = entry_path.filename().string();
        if (!context.options.include_hidden && is_hidden(name)) continue;
        if (considered >= context.options.max_entries_per_directory) break;
        ++considered;

        std::error_code status_ec;
        const fs::file_status status = fs::status(entry_path, status_ec);
        if (status_ec || !fs::exists(status)) {
            ++context.stats.entries_skipped;
            continue;
        }

        bool ok = false;
        treemap_model::TreemapNode node = scan_entry(entry_path, name, status, child_depth, context, ok);
        if (!ok) {
            ++context.stats.entries_skipped;
            continue;
        }
        ++context.stats.entries_visited;
        nodes.push_back(std::move(node));
        if (context.options.on_entry) context.options.on_entry(nodes.back());
    }

    std::stable_sort(nodes.begin(), nodes.end(),
        [](const treemap_model::TreemapNode& a, const treemap_model::TreemapNode& b) { return a.size > b.size; });
    if (nodes.size() > context.options.max_children)
        nodes.resize(context.options.max_children);
    return nodes;
}

} // namespace

treemap_model::TreemapNode make_error_node(const fs::path& root) {
    return treemap_model::make_leaf("Error", root.string(), 0, treemap_model::FileTypeCategory::Other);
}

treemap_model::TreemapNode scan_path(const fs::path& root,
    const ScanOptions& options,
    const CancellationFlag& cancel,
    ScanStats* stats)
{
    ScanContext context{ options, cancel, {}, {} };

    std::error_code ec;
    const fs::file_status status = fs::status(root, ec);
    treemap_model::TreemapNode result;
    if (ec || !fs::exists(status)) {
        spdlog::debug("scan: root {} unavailable: {}", root.string(),
            ec ? ec.message() : std::string("does not exist"));
        result = make_error_node(root);
    } else if (fs::is_directory(status)) {
        auto children = scan_directory(root, 0, context);
        result = treemap_model::make_directory(display_name(root), root.string(), std::move(children), 0);
    } else {
        bool ok = false;
        result = scan_entry(root, display_name(root), status, 0, context, ok);
        if (!ok) result = make_error_node(root);
    }

    if (stats) *stats = context.stats;
    return result;
}

} // namespace treemap_scan
