#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "flashdrop/core/time.h"
#include "flashdrop/metadata/json_metadata_store.h"
#include "flashdrop/retrieval/retrieval_gateway.h"
#include "flashdrop/storage/local_storage.h"

namespace {

class RetrievalGatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() /
                ("flashdrop_gateway_" + Poco::UUIDGenerator().createOne().toString());
        storage_ = std::make_shared<flashdrop::storage::LocalStorage>(
            (root_ / "uploads").string(), (root_ / "chunks").string(), (root_ / "tmp").string());
        metadata_ = std::make_shared<flashdrop::metadata::JsonMetadataStore>(root_ /
                                                                             "metadata.json");
        gateway_ = std::make_shared<flashdrop::retrieval::RetrievalGateway>(metadata_, storage_);

        record_.id = "Xy12ab";
        record_.original_name = "cat.jpg";
        record_.mime_type = "image/jpeg";
        record_.size_bytes = 4;
        record_.human_size = "4 Bytes";
        record_.upload_time = uploaded_;
        record_.expiry_time = flashdrop::core::AddSeconds(uploaded_, 24 * 3600);
        record_.extension = ".jpg";
        ASSERT_TRUE(metadata_->Insert(record_).ok());
        std::ofstream(storage_->ObjectPath(record_.id, record_.extension), std::ios::binary)
            << "\xff\xd8\xff\xe0";
    }

    void TearDown() override { std::filesystem::remove_all(root_); }

    Poco::Timestamp At(int hours) const {
        return flashdrop::core::AddSeconds(uploaded_, static_cast<long long>(hours) * 3600);
    }

    std::filesystem::path root_;
    Poco::Timestamp uploaded_{Poco::Timestamp::TimeVal(1700000000000000LL)};
    flashdrop::metadata::FileRecord record_;
    std::shared_ptr<flashdrop::storage::LocalStorage> storage_;
    std::shared_ptr<flashdrop::metadata::JsonMetadataStore> metadata_;
    std::shared_ptr<flashdrop::retrieval::RetrievalGateway> gateway_;
};

}  // namespace

TEST_F(RetrievalGatewayTest, ResolvesLiveFileByIdOrName) {
    auto by_id = gateway_->Resolve("Xy12ab", At(23));
    ASSERT_TRUE(by_id.ok());
    EXPECT_EQ(by_id.value().record, record_);
    EXPECT_EQ(by_id.value().path, storage_->ObjectPath("Xy12ab", ".jpg"));

    auto by_name = gateway_->Resolve("Xy12ab.jpg", At(23));
    ASSERT_TRUE(by_name.ok());
    EXPECT_EQ(by_name.value().record.id, "Xy12ab");
}

TEST_F(RetrievalGatewayTest, ExpiredBeforeReaperRuns) {
    auto result = gateway_->Resolve("Xy12ab.jpg", At(25));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, flashdrop::core::ErrorCode::kExpired);
    // Read-time expiry does not mutate the store; the reaper reclaims later.
    EXPECT_TRUE(metadata_->Get("Xy12ab").ok());

    auto at_boundary = gateway_->Resolve("Xy12ab", record_.expiry_time);
    EXPECT_TRUE(at_boundary.ok());
}

TEST_F(RetrievalGatewayTest, UnknownUnsafeOrMissingObjectIsNotFound) {
    auto unknown = gateway_->Resolve("zzzzzz", At(1));
    ASSERT_FALSE(unknown.ok());
    EXPECT_EQ(unknown.error().code, flashdrop::core::ErrorCode::kNotFound);

    auto unsafe = gateway_->Resolve("..", At(1));
    ASSERT_FALSE(unsafe.ok());
    EXPECT_EQ(unsafe.error().code, flashdrop::core::ErrorCode::kNotFound);

    std::filesystem::remove(storage_->ObjectPath("Xy12ab", ".jpg"));
    auto gone = gateway_->Resolve("Xy12ab", At(1));
    ASSERT_FALSE(gone.ok());
    EXPECT_EQ(gone.error().code, flashdrop::core::ErrorCode::kNotFound);
}

TEST(RetrievalGateway, RawPreference) {
    using flashdrop::retrieval::RetrievalGateway;
    EXPECT_TRUE(RetrievalGateway::PreferRawResponse("true", ""));
    EXPECT_TRUE(RetrievalGateway::PreferRawResponse("", "image/avif,image/webp,*/*"));
    EXPECT_TRUE(RetrievalGateway::PreferRawResponse("", "video/mp4"));
    EXPECT_FALSE(RetrievalGateway::PreferRawResponse("", "text/html,application/xhtml+xml"));
    EXPECT_FALSE(RetrievalGateway::PreferRawResponse("false", ""));
    EXPECT_EQ(RetrievalGateway::BaseId("abc123.tar.gz"), "abc123");
}
