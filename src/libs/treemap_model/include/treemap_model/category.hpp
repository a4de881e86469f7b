#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace treemap_model {

enum class FileTypeCategory {
    Images,
    Videos,
    Audio,
    Documents,
    Code,
    Archives,
    System,
    Other
};

constexpr std::size_t category_count = 8;

struct CategoryColor {
    float r = 0;
    float g = 0;
    float b = 0;
};

// Case-insensitive; a leading '.' is ignored. Unknown extensions map to Other.
FileTypeCategory classify_extension(std::string_view extension);

const char* category_name(FileTypeCategory category);
CategoryColor category_color(FileTypeCategory category);

// Enum order; also the tie-break order for dominant category selection.
const std::array<FileTypeCategory, category_count>& all_categories();

inline std::size_t category_index(FileTypeCategory category) {
    return static_cast<std::size_t>(category);
}

} // namespace treemap_model
