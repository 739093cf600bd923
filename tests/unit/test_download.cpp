#include <gtest/gtest.h>

#include "stitchfs/http/download.h"

using stitchfs::http::ParseByteRange;

TEST(ByteRange, ParsesClosedAndOpenRanges) {
    auto closed = ParseByteRange("bytes=0-4", 23);
    ASSERT_TRUE(closed);
    EXPECT_EQ(closed->first, 0u);
    EXPECT_EQ(closed->last, 4u);
    EXPECT_EQ(closed->length(), 5u);

    auto open = ParseByteRange("bytes=20-", 23);
    ASSERT_TRUE(open);
    EXPECT_EQ(open->first, 20u);
    EXPECT_EQ(open->last, 22u);
}

TEST(ByteRange, ClampsEndAndHandlesSuffix) {
    auto clamped = ParseByteRange("bytes=10-999", 23);
    ASSERT_TRUE(clamped);
    EXPECT_EQ(clamped->last, 22u);

    auto suffix = ParseByteRange("bytes=-3", 23);
    ASSERT_TRUE(suffix);
    EXPECT_EQ(suffix->first, 20u);
    EXPECT_EQ(suffix->last, 22u);

    auto whole = ParseByteRange("bytes=-100", 23);
    ASSERT_TRUE(whole);
    EXPECT_EQ(whole->first, 0u);
}

TEST(ByteRange, RejectsUnsatisfiableOrMalformed) {
    EXPECT_FALSE(ParseByteRange("bytes=23-30", 23));
    EXPECT_FALSE(ParseByteRange("bytes=5-2", 23));
    EXPECT_FALSE(ParseByteRange("bytes=0-1,4-5", 23));
    EXPECT_FALSE(ParseByteRange("items=0-1", 23));
    EXPECT_FALSE(ParseByteRange("bytes=abc-", 23));
    EXPECT_FALSE(ParseByteRange("bytes=-0", 23));
    EXPECT_FALSE(ParseByteRange("bytes=0-4", 0));
}

TEST(Download, OnlyPublishedNamesAreServed) {
    EXPECT_TRUE(stitchfs::http::IsDownloadableName("out.bin"));
    EXPECT_FALSE(stitchfs::http::IsDownloadableName(".assembling-1234"));
    EXPECT_FALSE(stitchfs::http::IsDownloadableName("../secret"));
    EXPECT_FALSE(stitchfs::http::IsDownloadableName("a\\b"));
    EXPECT_FALSE(stitchfs::http::IsDownloadableName(""));
}

TEST(Download, PatternIgnoresTrailingSlash) {
    EXPECT_EQ(stitchfs::http::DownloadPattern("/uploads/"), "/uploads/{name}");
    EXPECT_EQ(stitchfs::http::DownloadPattern("/files"), "/files/{name}");
}
