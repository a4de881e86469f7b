#include <treemap_loaders/json_loader.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <cmath>
#include <fstream>

namespace treemap_loaders {

namespace {

// Each reader leaves `out` untouched when the key is missing and returns false on a type mismatch.

bool read_string(const nlohmann::json& j, const char* key, std::string& out) {
    if (!j.contains(key)) return true;
    if (!j[key].is_string()) return false;
    out = j[key].get<std::string>();
    return true;
}

bool read_bool(const nlohmann::json& j, const char* key, bool& out) {
    if (!j.contains(key)) return true;
    if (!j[key].is_boolean()) return false;
    out = j[key].get<bool>();
    return true;
}

bool read_number(const nlohmann::json& j, const char* key, double& out) {
    if (!j.contains(key)) return true;
    if (!j[key].is_number()) return false;
    out = j[key].get<double>();
    return true;
}

template <typename T>
bool read_count(const nlohmann::json& j, const char* key, T& out) {
    if (!j.contains(key)) return true;
    if (!j[key].is_number_integer() || j[key].get<long long>() < 0) return false;
    out = static_cast<T>(j[key].get<long long>());
    return true;
}

bool parse_scan_options(const nlohmann::json& j, treemap_scan::ScanOptions& scan) {
    if (!j.is_object()) return false;
    if (!read_count(j, "max_entries_per_directory", scan.max_entries_per_directory)) return false;
    if (!read_count(j, "max_children", scan.max_children)) return false;
    if (!read_count(j, "directory_placeholder_bytes", scan.directory_placeholder_size)) return false;
    if (!read_count(j, "max_depth", scan.max_depth)) return false;
    if (!read_bool(j, "include_hidden", scan.include_hidden)) return false;

    double timeout_seconds = static_cast<double>(scan.timeout.count()) / 1000.0;
    if (!read_number(j, "timeout_seconds", timeout_seconds)) return false;
    scan.timeout = std::chrono::milliseconds(static_cast<long long>(std::llround(timeout_seconds * 1000.0)));

    if (scan.max_depth < 1) scan.max_depth = 1;
    return true;
}

std::optional<ViewerConfig> parse_json(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    ViewerConfig config = default_viewer_config();

    if (!read_string(j, "root_path", config.root_path)) return std::nullopt;
    if (!read_bool(j, "show_legend", config.show_legend)) return std::nullopt;

    double animation_seconds = config.animation_seconds;
    if (!read_number(j, "animation_seconds", animation_seconds)) return std::nullopt;
    config.animation_seconds = static_cast<float>(animation_seconds);

    if (!read_number(j, "label_min_width", config.label_min_width)) return std::nullopt;
    if (!read_number(j, "label_min_height", config.label_min_height)) return std::nullopt;
    if (!read_number(j, "size_label_min_height", config.size_label_min_height)) return std::nullopt;

    if (j.contains("scan") && !parse_scan_options(j["scan"], config.scan)) return std::nullopt;
    return config;
}

} // namespace

std::optional<ViewerConfig> load_viewer_config_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_json(j);
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("config: invalid JSON: {}", e.what());
        return std::nullopt;
    }
}

std::optional<ViewerConfig> load_viewer_config_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        spdlog::warn("config: cannot open {}", path);
        return std::nullopt;
    }
    return load_viewer_config_from_json(f);
}

} // namespace treemap_loaders
