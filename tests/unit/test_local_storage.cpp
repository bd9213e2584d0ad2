#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "flashdrop/storage/local_storage.h"

namespace {

std::filesystem::path MakeTempDir() {
    const auto name = "flashdrop_storage_" + Poco::UUIDGenerator().createOne().toString();
    return std::filesystem::temp_directory_path() / name;
}

void Age(const std::filesystem::path& path, std::chrono::hours by) {
    std::filesystem::last_write_time(path, std::filesystem::file_time_type::clock::now() - by);
}

}  // namespace

TEST(PathSafety, AcceptsSimpleNames) {
    EXPECT_TRUE(flashdrop::storage::LocalStorage::IsSafeName("aB3xYz"));
    EXPECT_TRUE(flashdrop::storage::LocalStorage::IsSafeName("obj-1.png"));
}

TEST(PathSafety, RejectsTraversal) {
    EXPECT_FALSE(flashdrop::storage::LocalStorage::IsSafeName("../secret"));
    EXPECT_FALSE(flashdrop::storage::LocalStorage::IsSafeName(".."));
    EXPECT_FALSE(flashdrop::storage::LocalStorage::IsSafeName("a/b"));
    EXPECT_FALSE(flashdrop::storage::LocalStorage::IsSafeName(""));
}

TEST(Extensions, AreLowerCasedAndGated) {
    using flashdrop::storage::LocalStorage;
    EXPECT_EQ(LocalStorage::ExtensionOf("Holiday.JPG"), ".jpg");
    EXPECT_EQ(LocalStorage::ExtensionOf("archive.tar.gz"), ".gz");
    EXPECT_EQ(LocalStorage::ExtensionOf("README"), "");
    EXPECT_TRUE(LocalStorage::IsAllowedExtension(".webm"));
    EXPECT_TRUE(LocalStorage::IsAllowedExtension(".jpeg"));
    EXPECT_FALSE(LocalStorage::IsAllowedExtension(".exe"));
    EXPECT_FALSE(LocalStorage::IsAllowedExtension(""));
}

TEST(LocalStorage, LaysOutChunksAndObjects) {
    const auto root = MakeTempDir();
    flashdrop::storage::LocalStorage storage((root / "uploads").string(),
                                             (root / "chunks").string(),
                                             (root / "tmp").string());
    EXPECT_TRUE(std::filesystem::is_directory(root / "chunks"));
    EXPECT_EQ(storage.ChunkPath("tok", 2, ".png"), root / "chunks" / "tok_2.png");
    EXPECT_EQ(storage.ObjectPath("abc123", ".pdf"), root / "uploads" / "abc123.pdf");
    EXPECT_EQ(storage.NewTempPath().parent_path(), root / "tmp");

    EXPECT_FALSE(storage.HasObjectWithId("abc123"));
    std::ofstream(storage.ObjectPath("abc123", ".pdf")) << "%PDF-";
    EXPECT_TRUE(storage.HasObjectWithId("abc123"));

    std::filesystem::remove_all(root);
}

TEST(LocalStorage, WriteChunkReportsBytesAndOverwrites) {
    const auto root = MakeTempDir();
    flashdrop::storage::LocalStorage storage((root / "uploads").string(),
                                             (root / "chunks").string(),
                                             (root / "tmp").string());
    const auto path = storage.ChunkPath("tok", 0, ".png");

    auto first = storage.WriteChunk(path, std::string(100, 'a'));
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first.value(), 100u);
    auto second = storage.WriteChunk(path, std::string(10, 'b'));
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(std::filesystem::file_size(path), 10u);

    auto failed = storage.WriteChunk(root / "missing-dir" / "x.png", "data");
    ASSERT_FALSE(failed.ok());
    EXPECT_EQ(failed.error().code, flashdrop::core::ErrorCode::kChunkWriteFailed);

    EXPECT_TRUE(storage.RemoveFile(path).ok());
    EXPECT_TRUE(storage.RemoveFile(path).ok());

    std::filesystem::remove_all(root);
}

TEST(LocalStorage, SweepsOnlyStaleChunks) {
    const auto root = MakeTempDir();
    flashdrop::storage::LocalStorage storage((root / "uploads").string(),
                                             (root / "chunks").string(),
                                             (root / "tmp").string());
    const auto stale = storage.ChunkPath("old", 0, ".png");
    const auto fresh = storage.ChunkPath("new", 0, ".png");
    ASSERT_TRUE(storage.WriteChunk(stale, "x").ok());
    ASSERT_TRUE(storage.WriteChunk(fresh, "y").ok());
    Age(stale, std::chrono::hours(25));

    auto result = storage.RemoveStaleChunks(std::chrono::hours(24));
    EXPECT_EQ(result.removed, 1u);
    EXPECT_EQ(result.failed, 0u);
    EXPECT_FALSE(std::filesystem::exists(stale));
    EXPECT_TRUE(std::filesystem::exists(fresh));

    std::filesystem::remove_all(root);
}
