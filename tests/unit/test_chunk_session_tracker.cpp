#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "flashdrop/core/time.h"
#include "flashdrop/storage/local_storage.h"
#include "flashdrop/upload/chunk_session_tracker.h"

namespace {

class ChunkSessionTrackerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() /
                ("flashdrop_tracker_" + Poco::UUIDGenerator().createOne().toString());
        storage_ = std::make_shared<flashdrop::storage::LocalStorage>(
            (root_ / "uploads").string(), (root_ / "chunks").string(), (root_ / "tmp").string());
        now_ = std::make_shared<Poco::Timestamp>(Poco::Timestamp::TimeVal(1700000000000000LL));
        auto now = now_;
        tracker_ = std::make_shared<flashdrop::upload::ChunkSessionTracker>(
            storage_, 4096, [now]() { return *now; });
    }

    void TearDown() override { std::filesystem::remove_all(root_); }

    flashdrop::upload::ChunkUpload Chunk(const std::string& token, const std::string& name,
                                         int index, int total, const std::string& data) {
        payloads_.push_back(std::make_unique<std::string>(data));
        flashdrop::upload::ChunkUpload chunk;
        chunk.session_token = token;
        chunk.file_name = name;
        chunk.chunk_index = index;
        chunk.total_chunks = total;
        chunk.data = *payloads_.back();
        return chunk;
    }

    std::size_t ChunkFiles() const {
        std::size_t count = 0;
        for (const auto& entry : std::filesystem::directory_iterator(root_ / "chunks")) {
            (void)entry;
            ++count;
        }
        return count;
    }

    std::filesystem::path root_;
    std::shared_ptr<flashdrop::storage::LocalStorage> storage_;
    std::shared_ptr<Poco::Timestamp> now_;
    std::shared_ptr<flashdrop::upload::ChunkSessionTracker> tracker_;
    std::vector<std::unique_ptr<std::string>> payloads_;
};

}  // namespace

TEST_F(ChunkSessionTrackerTest, DisallowedExtensionCreatesNoState) {
    auto result = tracker_->PutChunk(Chunk("", "payload.exe", 0, 1, "MZ"));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, flashdrop::core::ErrorCode::kInvalidFileType);
    EXPECT_EQ(tracker_->Count(), 0u);
    EXPECT_EQ(ChunkFiles(), 0u);

    auto unknown = tracker_->PutChunk(Chunk("no-such-token", "payload.exe", 1, 2, "MZ"));
    ASSERT_FALSE(unknown.ok());
    EXPECT_EQ(unknown.error().code, flashdrop::core::ErrorCode::kInvalidFileType);
}

TEST_F(ChunkSessionTrackerTest, FirstChunkIssuesTokenLaterChunksJoin) {
    auto first = tracker_->PutChunk(Chunk("", "clip.MP4", 1, 3, "bbbb"));
    ASSERT_TRUE(first.ok());
    const auto token = first.value().session_token;
    EXPECT_FALSE(token.empty());
    EXPECT_EQ(first.value().path.filename().string(), token + "_1.mp4");
    EXPECT_FALSE(tracker_->IsComplete(token, 3));

    ASSERT_TRUE(tracker_->PutChunk(Chunk(token, "clip.MP4", 0, 3, "aa")).ok());
    ASSERT_TRUE(tracker_->PutChunk(Chunk(token, "clip.MP4", 2, 3, "c")).ok());
    EXPECT_TRUE(tracker_->IsComplete(token, 3));
    EXPECT_EQ(tracker_->Count(), 1u);
    EXPECT_EQ(ChunkFiles(), 3u);
    EXPECT_TRUE(std::filesystem::is_empty(root_ / "tmp"));

    auto session = tracker_->TakeSession(token, 3);
    ASSERT_TRUE(session.ok());
    EXPECT_EQ(session.value().extension, ".mp4");
    EXPECT_EQ(session.value().total_bytes, 7u);
    EXPECT_EQ(tracker_->Count(), 0u);
}

TEST_F(ChunkSessionTrackerTest, SeparateUploadsOfSameNameDoNotMix) {
    auto a = tracker_->PutChunk(Chunk("", "photo.png", 0, 1, "first"));
    auto b = tracker_->PutChunk(Chunk("", "photo.png", 0, 1, "second"));
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    EXPECT_NE(a.value().session_token, b.value().session_token);
    EXPECT_EQ(tracker_->Count(), 2u);
}

TEST_F(ChunkSessionTrackerTest, UnknownOrMismatchedSessionIsRejected) {
    auto unknown = tracker_->PutChunk(Chunk("missing", "photo.png", 0, 1, "x"));
    ASSERT_FALSE(unknown.ok());
    EXPECT_EQ(unknown.error().code, flashdrop::core::ErrorCode::kSessionNotFound);

    auto opened = tracker_->PutChunk(Chunk("", "photo.png", 0, 2, "x"));
    ASSERT_TRUE(opened.ok());
    auto mismatch =
        tracker_->PutChunk(Chunk(opened.value().session_token, "other.png", 1, 2, "y"));
    ASSERT_FALSE(mismatch.ok());
    EXPECT_EQ(mismatch.error().code, flashdrop::core::ErrorCode::kSessionNotFound);
}

TEST_F(ChunkSessionTrackerTest, DuplicateIndexOverwrites) {
    auto first = tracker_->PutChunk(Chunk("", "doc.pdf", 0, 1, "old-bytes"));
    ASSERT_TRUE(first.ok());
    const auto token = first.value().session_token;
    ASSERT_TRUE(tracker_->PutChunk(Chunk(token, "doc.pdf", 0, 1, "new")).ok());

    auto session = tracker_->TakeSession(token, 1);
    ASSERT_TRUE(session.ok());
    EXPECT_EQ(session.value().total_bytes, 3u);
    EXPECT_EQ(std::filesystem::file_size(session.value().chunks.at(0).path), 3u);
}

TEST_F(ChunkSessionTrackerTest, RejectsSessionsOverTheSizeLimit) {
    auto first = tracker_->PutChunk(Chunk("", "big.webm", 0, 2, std::string(3000, 'a')));
    ASSERT_TRUE(first.ok());
    auto second = tracker_->PutChunk(
        Chunk(first.value().session_token, "big.webm", 1, 2, std::string(2000, 'b')));
    ASSERT_FALSE(second.ok());
    EXPECT_EQ(second.error().code, flashdrop::core::ErrorCode::kFileTooLarge);

    auto single = tracker_->PutChunk(Chunk("", "huge.webm", 0, 1, std::string(5000, 'c')));
    ASSERT_FALSE(single.ok());
    EXPECT_EQ(single.error().code, flashdrop::core::ErrorCode::kFileTooLarge);
}

TEST_F(ChunkSessionTrackerTest, TakeSessionRequiresContiguousIndices) {
    auto first = tracker_->PutChunk(Chunk("", "a.gif", 0, 3, "x"));
    ASSERT_TRUE(first.ok());
    const auto token = first.value().session_token;
    ASSERT_TRUE(tracker_->PutChunk(Chunk(token, "a.gif", 2, 3, "z")).ok());

    auto missing = tracker_->TakeSession(token, 3);
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error().code, flashdrop::core::ErrorCode::kMissingChunks);
    EXPECT_EQ(tracker_->Count(), 1u);

    // Two chunks with indices {0, 2} must not satisfy a claim of two chunks.
    auto wrong_total = tracker_->TakeSession(token, 2);
    ASSERT_FALSE(wrong_total.ok());
    EXPECT_EQ(wrong_total.error().code, flashdrop::core::ErrorCode::kMissingChunks);

    auto unknown = tracker_->TakeSession("nope", 1);
    ASSERT_FALSE(unknown.ok());
    EXPECT_EQ(unknown.error().code, flashdrop::core::ErrorCode::kSessionNotFound);
}

TEST_F(ChunkSessionTrackerTest, ExpireIdleDropsOnlyStaleSessions) {
    auto stale = tracker_->PutChunk(Chunk("", "old.jpg", 0, 2, "x"));
    ASSERT_TRUE(stale.ok());
    *now_ = flashdrop::core::AddSeconds(*now_, 7200);
    auto fresh = tracker_->PutChunk(Chunk("", "new.jpg", 0, 2, "y"));
    ASSERT_TRUE(fresh.ok());

    auto expired = tracker_->ExpireIdle(flashdrop::core::AddSeconds(*now_, -3600));
    ASSERT_EQ(expired.size(), 1u);
    EXPECT_EQ(expired.front().token, stale.value().session_token);
    EXPECT_EQ(tracker_->Count(), 1u);
    EXPECT_TRUE(std::filesystem::exists(expired.front().chunks.at(0).path));
}

TEST_F(ChunkSessionTrackerTest, ChunkAfterSessionIsTakenLeavesNoFiles) {
    auto first = tracker_->PutChunk(Chunk("", "still.jpg", 0, 1, "jpeg-bytes"));
    ASSERT_TRUE(first.ok());
    const auto token = first.value().session_token;
    auto session = tracker_->TakeSession(token, 1);
    ASSERT_TRUE(session.ok());

    auto late = tracker_->PutChunk(Chunk(token, "still.jpg", 0, 1, "retry"));
    ASSERT_FALSE(late.ok());
    EXPECT_EQ(late.error().code, flashdrop::core::ErrorCode::kSessionNotFound);
    // The taken session still owns its original chunk file, untouched.
    std::ifstream in(session.value().chunks.at(0).path, std::ios::binary);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "jpeg-bytes");
    EXPECT_TRUE(std::filesystem::is_empty(root_ / "tmp"));
}

TEST_F(ChunkSessionTrackerTest, ConcurrentSessionsStayConsistent) {
    // Payloads are built up front; PutChunk only borrows the bytes.
    constexpr int kThreads = 8;
    constexpr int kChunks = 6;
    std::vector<std::string> payloads;
    for (int t = 0; t < kThreads; ++t) {
        payloads.push_back(std::string(64, static_cast<char>('a' + t)));
    }

    std::vector<std::string> tokens(kThreads);
    std::vector<int> failures(kThreads, 0);
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([this, &payloads, &tokens, &failures, t]() {
            const auto name = "upload" + std::to_string(t) + ".webm";
            for (int index = kChunks - 1; index >= 0; --index) {
                flashdrop::upload::ChunkUpload chunk;
                chunk.session_token = tokens[static_cast<std::size_t>(t)];
                chunk.file_name = name;
                chunk.chunk_index = index;
                chunk.total_chunks = kChunks;
                chunk.data = payloads[static_cast<std::size_t>(t)];
                auto stored = tracker_->PutChunk(chunk);
                if (!stored.ok()) {
                    ++failures[static_cast<std::size_t>(t)];
                    return;
                }
                tokens[static_cast<std::size_t>(t)] = stored.value().session_token;
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(tracker_->Count(), static_cast<std::size_t>(kThreads));
    EXPECT_EQ(ChunkFiles(), static_cast<std::size_t>(kThreads * kChunks));
    EXPECT_TRUE(std::filesystem::is_empty(root_ / "tmp"));
    for (int t = 0; t < kThreads; ++t) {
        EXPECT_EQ(failures[static_cast<std::size_t>(t)], 0);
        auto session = tracker_->TakeSession(tokens[static_cast<std::size_t>(t)], kChunks);
        ASSERT_TRUE(session.ok());
        EXPECT_EQ(session.value().total_bytes, static_cast<std::uint64_t>(64 * kChunks));
        EXPECT_EQ(session.value().file_name, "upload" + std::to_string(t) + ".webm");
    }
    EXPECT_EQ(tracker_->Count(), 0u);
}
