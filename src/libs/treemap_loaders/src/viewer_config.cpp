#include <treemap_loaders/viewer_config.hpp>
#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace treemap_loaders {

std::string default_root_path() {
    if (const char* home = std::getenv("HOME"); home && *home)
        return home;
    std::error_code ec;
    const auto cwd = std::filesystem::current_path(ec);
    if (ec) return ".";
    return cwd.string();
}

ViewerConfig default_viewer_config() {
    ViewerConfig config;
    config.root_path = default_root_path();
    return config;
}

} // namespace treemap_loaders
