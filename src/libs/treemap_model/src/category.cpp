#include <treemap_model/category.hpp>
#include <algorithm>
#include <cctype>
#include <string>
#include <unordered_map>

namespace treemap_model {

namespace {

using ExtensionTable = std::unordered_map<std::string, FileTypeCategory>;

void add_extensions(ExtensionTable& table, FileTypeCategory category,
    std::initializer_list<const char*> extensions)
{
    for (const char* ext : extensions)
        table.emplace(ext, category);
}

ExtensionTable build_extension_table() {
    ExtensionTable table;
    add_extensions(table, FileTypeCategory::Images,
        { "jpg", "jpeg", "png", "gif", "bmp", "tiff", "webp", "heic", "ico", "svg" });
    add_extensions(table, FileTypeCategory::Videos,
        { "mp4", "mov", "avi", "mkv", "flv", "wmv", "webm", "m4v" });
    add_extensions(table, FileTypeCategory::Audio,
        { "mp3", "m4a", "wav", "flac", "aac", "ogg", "wma" });
    add_extensions(table, FileTypeCategory::Documents,
        { "pdf", "doc", "docx", "txt", "rtf", "pages", "xls", "xlsx", "ppt", "pptx" });
    add_extensions(table, FileTypeCategory::Code,
        { "swift", "m", "h", "cpp", "c", "js", "jsx", "ts", "tsx", "py", "go", "rs",
          "java", "kt", "json", "xml", "yaml", "yml" });
    add_extensions(table, FileTypeCategory::Archives,
        { "zip", "rar", "7z", "tar", "gz", "bz2", "dmg", "pkg" });
    return table;
}

const ExtensionTable& extension_table() {
    static const ExtensionTable table = build_extension_table();
    return table;
}

} // namespace

FileTypeCategory classify_extension(std::string_view extension) {
    if (!extension.empty() && extension.front() == '.')
        extension.remove_prefix(1);
    if (extension.empty()) return FileTypeCategory::Other;

    std::string lower(extension);
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto& table = extension_table();
    auto it = table.find(lower);
    if (it == table.end()) return FileTypeCategory::Other;
    return it->second;
}

const char* category_name(FileTypeCategory category) {
    switch (category) {
    case FileTypeCategory::Images: return "Images";
    case FileTypeCategory::Videos: return "Videos";
    case FileTypeCategory::Audio: return "Audio";
    case FileTypeCategory::Documents: return "Documents";
    case FileTypeCategory::Code: return "Code";
    case FileTypeCategory::Archives: return "Archives";
    case FileTypeCategory::System: return "System";
    case FileTypeCategory::Other: return "Other";
    }
    return "Other";
}

CategoryColor category_color(FileTypeCategory category) {
    switch (category) {
    case FileTypeCategory::Images: return { 0.3f, 0.6f, 1.0f };
    case FileTypeCategory::Videos: return { 0.8f, 0.3f, 0.5f };
    case FileTypeCategory::Audio: return { 1.0f, 0.6f, 0.0f };
    case FileTypeCategory::Documents: return { 0.4f, 0.5f, 0.6f };
    case FileTypeCategory::Code: return { 0.3f, 0.7f, 0.4f };
    case FileTypeCategory::Archives: return { 0.6f, 0.5f, 0.3f };
    case FileTypeCategory::System: return { 0.5f, 0.5f, 0.5f };
    case FileTypeCategory::Other: return { 0.6f, 0.4f, 0.6f };
    }
    return { 0.6f, 0.4f, 0.6f };
}

const std::array<FileTypeCategory, category_count>& all_categories() {
    static const std::array<FileTypeCategory, category_count> categories = {
        FileTypeCategory::Images,
        FileTypeCategory::Videos,
        FileTypeCategory::Audio,
        FileTypeCategory::Documents,
        FileTypeCategory::Code,
        FileTypeCategory::Archives,
        FileTypeCategory::System,
        FileTypeCategory::Other,
    };
    return categories;
}

} // namespace treemap_model
