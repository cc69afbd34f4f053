#include <catch2/catch_test_macros.hpp>
#include <frameline/core/filesystem.hpp>
#include <filesystem>

using namespace frameline::core;

TEST_CASE("FileSystem text files", "[core][filesystem]") {
    auto root = std::filesystem::temp_directory_path() / "frameline_fs_test";
    std::filesystem::remove_all(root);
    std::string dir = FileSystem::join(root.string(), "nested/dir");

    REQUIRE(FileSystem::create_directories(dir));
    REQUIRE(FileSystem::exists(dir));

    std::string path = FileSystem::join(dir, "a.txt");
    REQUIRE_FALSE(FileSystem::exists(path));
    REQUIRE(FileSystem::read_text(path).empty());

    REQUIRE(FileSystem::write_text(path, "first"));
    REQUIRE(FileSystem::read_text(path) == "first");

    REQUIRE(FileSystem::write_text(path, "second"));
    REQUIRE(FileSystem::read_text(path) == "second");
    REQUIRE_FALSE(FileSystem::exists(path + ".tmp"));

    std::filesystem::remove_all(root);
}

TEST_CASE("FileSystem join", "[core][filesystem]") {
    REQUIRE(FileSystem::join("", "file.json") == "file.json");
    REQUIRE(FileSystem::join("timing", "file.json") == (std::filesystem::path("timing") / "file.json").string());
}
