#include <string>

#include <gtest/gtest.h>

#include "flashdrop/core/human_size.h"
#include "flashdrop/core/time.h"
#include "flashdrop/storage/mime_sniffer.h"

TEST(HumanSize, UsesDecimalUnits) {
    EXPECT_EQ(flashdrop::core::HumanSize(0), "0 Bytes");
    EXPECT_EQ(flashdrop::core::HumanSize(1), "1 Byte");
    EXPECT_EQ(flashdrop::core::HumanSize(999), "999 Bytes");
    EXPECT_EQ(flashdrop::core::HumanSize(1000), "1.0 kB");
    EXPECT_EQ(flashdrop::core::HumanSize(3584), "3.6 kB");
    EXPECT_EQ(flashdrop::core::HumanSize(1500000), "1.5 MB");
    EXPECT_EQ(flashdrop::core::HumanSize(1073741824), "1.1 GB");
}

TEST(MimeSniffer, RecognizesAllowedUploadTypes) {
    using flashdrop::storage::SniffMimeType;
    EXPECT_EQ(SniffMimeType(std::string("\x89PNG\r\n\x1a\n\0\0", 10)), "image/png");
    EXPECT_EQ(SniffMimeType(std::string("\xff\xd8\xff\xe0", 4)), "image/jpeg");
    EXPECT_EQ(SniffMimeType("GIF89a...."), "image/gif");
    EXPECT_EQ(SniffMimeType("%PDF-1.7\n"), "application/pdf");
    EXPECT_EQ(SniffMimeType(std::string("\x1a\x45\xdf\xa3\x01", 5)), "video/webm");
    EXPECT_EQ(SniffMimeType(std::string("\0\0\0\x18" "ftypisom", 12)), "video/mp4");
}

TEST(MimeSniffer, FallsBackForUnknownContent) {
    using flashdrop::storage::SniffMimeType;
    EXPECT_EQ(SniffMimeType(""), "application/x-empty");
    EXPECT_EQ(SniffMimeType("hello world\n"), "text/plain");
    EXPECT_EQ(SniffMimeType(std::string("\x00\x01\x02\x03", 4)), "application/octet-stream");
}

TEST(Time, Iso8601KeepsMicroseconds) {
    const Poco::Timestamp stamp(Poco::Timestamp::TimeVal(1700000000123456LL));
    const auto text = flashdrop::core::FormatIso8601(stamp);

    auto parsed = flashdrop::core::ParseIso8601(text);
    ASSERT_TRUE(parsed.ok());
    EXPECT_EQ(parsed.value(), stamp);
    EXPECT_EQ(flashdrop::core::AddSeconds(stamp, 86400).epochMicroseconds(),
              stamp.epochMicroseconds() + 86400LL * 1000000LL);
}

TEST(Time, RejectsGarbage) {
    auto parsed = flashdrop::core::ParseIso8601("yesterday");
    ASSERT_FALSE(parsed.ok());
    EXPECT_EQ(parsed.error().code, flashdrop::core::ErrorCode::kInvalidArgument);
}
