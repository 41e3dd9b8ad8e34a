#include <gtest/gtest.h>

#include "ResumableProtocol.hpp"

TEST(ResumableProtocolTest, ContentRangeIsInclusive) {
    EXPECT_EQ(FormatContentRange(0, 10485760, 26214400),
              "bytes 0-10485759/26214400");
    EXPECT_EQ(FormatContentRange(20971520, 5242880, 26214400),
              "bytes 20971520-26214399/26214400");
    EXPECT_EQ(FormatContentRange(0, 1, 1), "bytes 0-0/1");
}

TEST(ResumableProtocolTest, ParsesRangeAcknowledgment) {
    EXPECT_EQ(ParseConfirmedBytes("bytes=0-9999999"), 10000000u);
    EXPECT_EQ(ParseConfirmedBytes("bytes=0-0"), 1u);
    EXPECT_EQ(ParseConfirmedBytes("  bytes=0-41 "), 42u);
}

TEST(ResumableProtocolTest, RejectsMalformedRange) {
    EXPECT_FALSE(ParseConfirmedBytes("").has_value());
    EXPECT_FALSE(ParseConfirmedBytes("bytes 0-10").has_value());
    EXPECT_FALSE(ParseConfirmedBytes("bytes=0").has_value());
    EXPECT_FALSE(ParseConfirmedBytes("bytes=0-").has_value());
    EXPECT_FALSE(ParseConfirmedBytes("bytes=10-5").has_value());
    EXPECT_FALSE(ParseConfirmedBytes("bytes=0-12x").has_value());
    EXPECT_FALSE(ParseConfirmedBytes("bytes=-5").has_value());
}

TEST(ResumableProtocolTest, RejectsRangeNotStartingAtZero) {
    EXPECT_FALSE(ParseConfirmedBytes("bytes=5-99").has_value());
    EXPECT_FALSE(ParseConfirmedBytes("bytes=1-1").has_value());
    EXPECT_FALSE(ParseConfirmedBytes("bytes=10000000-20971519").has_value());
}

TEST(ResumableProtocolTest, BaseHeadersCarryBearerToken) {
    const HttpHeaders with_token = MakeBaseHeaders("secret");
    ASSERT_EQ(with_token.count("authorization"), 1u);
    EXPECT_EQ(with_token.at("Authorization"), "Bearer secret");

    EXPECT_TRUE(MakeBaseHeaders("").empty());
}

TEST(ResumableProtocolTest, JoinEndpointNormalizesSlashes) {
    EXPECT_EQ(JoinEndpoint("https://host/v1", "uploads"),
              "https://host/v1/uploads");
    EXPECT_EQ(JoinEndpoint("https://host/v1/", "uploads"),
              "https://host/v1/uploads");
    EXPECT_EQ(JoinEndpoint("https://host/v1//", "/uploads"),
              "https://host/v1/uploads");
}

TEST(ResumableProtocolTest, HeaderLookupIgnoresCase) {
    HttpResponse response;
    response.headers["x-goog-upload-url"] = "https://upload/1";
    EXPECT_EQ(response.Header(kUploadUrlHeader), "https://upload/1");
    EXPECT_EQ(response.Header("Range"), "");
}
