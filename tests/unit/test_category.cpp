#include <catch2/catch.hpp>
#include <treemap_model/category.hpp>
#include <set>
#include <string>
#include <utility>
#include <vector>

using namespace treemap_model;

TEST_CASE("Extension classification", "[category]") {
    SECTION("Every known extension maps to its category") {
        const std::vector<std::pair<FileTypeCategory, std::vector<std::string>>> table = {
            { FileTypeCategory::Images, { "jpg", "jpeg", "png", "gif", "bmp", "tiff", "webp", "heic", "ico", "svg" } },
            { FileTypeCategory::Videos, { "mp4", "mov", "avi", "mkv", "flv", "wmv", "webm", "m4v" } },
            { FileTypeCategory::Audio, { "mp3", "m4a", "wav", "flac", "aac", "ogg", "wma" } },
            { FileTypeCategory::Documents, { "pdf", "doc", "docx", "txt", "rtf", "pages", "xls", "xlsx", "ppt", "pptx" } },
            { FileTypeCategory::Code, { "swift", "m", "h", "cpp", "c", "js", "jsx", "ts", "tsx", "py", "go", "rs",
                                        "java", "kt", "json", "xml", "yaml", "yml" } },
            { FileTypeCategory::Archives, { "zip", "rar", "7z", "tar", "gz", "bz2", "dmg", "pkg" } },
        };
        for (const auto& [category, extensions] : table) {
            for (const auto& ext : extensions) {
                INFO("extension " << ext);
                REQUIRE(classify_extension(ext) == category);
            }
        }
    }

    SECTION("Matching ignores case") {
        REQUIRE(classify_extension("JPG") == FileTypeCategory::Images);
        REQUIRE(classify_extension("jpg") == FileTypeCategory::Images);
        REQUIRE(classify_extension("Mp4") == FileTypeCategory::Videos);
        REQUIRE(classify_extension("PDF") == FileTypeCategory::Documents);
    }

    SECTION("Leading dot is ignored") {
        REQUIRE(classify_extension(".png") == FileTypeCategory::Images);
        REQUIRE(classify_extension(".TAR") == FileTypeCategory::Archives);
    }

    SECTION("Unknown and empty extensions are Other") {
        REQUIRE(classify_extension("xyz123") == FileTypeCategory::Other);
        REQUIRE(classify_extension("") == FileTypeCategory::Other);
        REQUIRE(classify_extension(".") == FileTypeCategory::Other);
        REQUIRE(classify_extension("tar.gz") == FileTypeCategory::Other);
    }
}

TEST_CASE("Category metadata", "[category]") {
    SECTION("All categories listed once in enum order") {
        const auto& all = all_categories();
        REQUIRE(all.size() == 8);
        for (std::size_t i = 0; i < all.size(); ++i)
            REQUIRE(category_index(all[i]) == i);
    }

    SECTION("Display names are distinct") {
        std::set<std::string> names;
        for (auto category : all_categories())
            names.insert(category_name(category));
        REQUIRE(names.size() == 8);
        REQUIRE(std::string(category_name(FileTypeCategory::Archives)) == "Archives");
    }

    SECTION("Colors are normalized") {
        for (auto category : all_categories()) {
            const CategoryColor c = category_color(category);
            REQUIRE(c.r >= 0.0f);
            REQUIRE(c.r <= 1.0f);
            REQUIRE(c.g >= 0.0f);
            REQUIRE(c.g <= 1.0f);
            REQUIRE(c.b >= 0.0f);
            REQUIRE(c.b <= 1.0f);
        }
    }
}
