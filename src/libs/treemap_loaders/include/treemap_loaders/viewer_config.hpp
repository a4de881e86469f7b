#pragma once

#include <treemap_scan/scan_options.hpp>
#include <string>

namespace treemap_loaders {

struct ViewerConfig {
    std::string root_path;
    bool show_legend = true;
    float animation_seconds = 0.3f;
    // Labels are drawn only inside rectangles larger than these (canvas units).
    double label_min_width = 40;
    double label_min_height = 20;
    double size_label_min_height = 35;
    treemap_scan::ScanOptions scan;
};

// $HOME when set, otherwise the current directory.
std::string default_root_path();

ViewerConfig default_viewer_config();

} // namespace treemap_loaders
