#pragma once

#include <treemap_loaders/viewer_config.hpp>
#include <optional>
#include <istream>
#include <string>

namespace treemap_loaders {

// Keys that are absent keep their defaults; a key holding the wrong JSON type fails the load.
std::optional<ViewerConfig> load_viewer_config_from_json(std::istream& in);
std::optional<ViewerConfig> load_viewer_config_from_json_file(const std::string& path);

} // namespace treemap_loaders
