#include "../http/HttpRange.hpp"
#include "../http/HttpUtils.hpp"
#include "../engine/Errors.hpp"
#include <gtest/gtest.h>

TEST(HttpRangeTest, NoHeaderServesWholeResource) {
    EXPECT_FALSE(HttpRange::parse("", 2048).has_value());
    EXPECT_FALSE(HttpRange::parse("   ", 2048).has_value());
}

TEST(HttpRangeTest, ClosedRange) {
    auto range = HttpRange::parse("bytes=0-1023", 2048);
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(0, range->start);
    EXPECT_EQ(1023, range->end);
    EXPECT_EQ(1024, range->length());
    EXPECT_EQ("bytes 0-1023/2048", HttpRange::contentRange(*range, 2048));
}

TEST(HttpRangeTest, OpenEndedRange) {
    auto range = HttpRange::parse("bytes=1000-", 2048);
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(1000, range->start);
    EXPECT_EQ(2047, range->end);
}

TEST(HttpRangeTest, SuffixRange) {
    auto range = HttpRange::parse("bytes=-100", 2048);
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(1948, range->start);
    EXPECT_EQ(2047, range->end);

    auto whole = HttpRange::parse("bytes=-5000", 2048);
    ASSERT_TRUE(whole.has_value());
    EXPECT_EQ(0, whole->start);
}

TEST(HttpRangeTest, EndIsClampedToResource) {
    auto range = HttpRange::parse("bytes=2000-99999", 2048);
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(2047, range->end);
}

TEST(HttpRangeTest, MultipleRangesServeWholeResource) {
    EXPECT_FALSE(HttpRange::parse("bytes=0-10, 20-30", 2048).has_value());
}

TEST(HttpRangeTest, UnsatisfiableRanges) {
    EXPECT_THROW(HttpRange::parse("bytes=2048-", 2048), RangeNotSatisfiableError);
    EXPECT_THROW(HttpRange::parse("bytes=500-100", 2048), RangeNotSatisfiableError);
    EXPECT_THROW(HttpRange::parse("bytes=-0", 2048), RangeNotSatisfiableError);
    EXPECT_THROW(HttpRange::parse("bytes=abc-", 2048), RangeNotSatisfiableError);
    EXPECT_THROW(HttpRange::parse("items=0-1", 2048), RangeNotSatisfiableError);
    EXPECT_THROW(HttpRange::parse("bytes=", 2048), RangeNotSatisfiableError);
    EXPECT_THROW(HttpRange::parse("bytes=0-1", 0), RangeNotSatisfiableError);
    EXPECT_EQ("bytes */2048", HttpRange::unsatisfiedRange(2048));
}

TEST(HttpRangeTest, UnsatisfiableCarriesLength) {
    try {
        HttpRange::parse("bytes=4096-", 2048);
        FAIL() << "Expected RangeNotSatisfiableError";
    } catch (const RangeNotSatisfiableError& e) {
        EXPECT_EQ(2048, e.length());
    }
}

TEST(HttpUtilsTest, SplitsTargetAndQuery) {
    auto [path, query] = HttpUtils::splitTarget("/add?magnet=abc&x=1");
    EXPECT_EQ("/add", path);
    EXPECT_EQ("magnet=abc&x=1", query);
    EXPECT_EQ("", HttpUtils::splitTarget("/status").second);
}

TEST(HttpUtilsTest, ParsesQueryValues) {
    auto values = HttpUtils::parseQuery("magnet=magnet%3A%3Fxt%3Durn&dn=My+Movie&dn=second&flag");
    EXPECT_EQ("magnet:?xt=urn", values.at("magnet"));
    EXPECT_EQ("My Movie", values.at("dn"));
    EXPECT_EQ("", values.at("flag"));
}

TEST(HttpUtilsTest, ContentTypeByExtension) {
    EXPECT_EQ("video/x-matroska", HttpUtils::contentTypeFor("movie.MKV"));
    EXPECT_EQ("video/x-msvideo", HttpUtils::contentTypeFor("movie.avi"));
    EXPECT_EQ("video/webm", HttpUtils::contentTypeFor("movie.webm"));
    EXPECT_EQ("video/mp4", HttpUtils::contentTypeFor("movie.mp4"));
    EXPECT_EQ("video/mp4", HttpUtils::contentTypeFor("movie.ts"));
}
