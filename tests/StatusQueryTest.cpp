#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "StatusQuery.hpp"
#include "mocks/HttpTransport.hpp"

using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;

class StatusQueryTest : public ::testing::Test {
   protected:
    void SetUp() override {
        session_.upload_url = "https://upload.test/s/3";
        session_.confirmed_bytes = 100;
        session_.total_bytes = 100;
    }

    std::tuple<bool, std::string, UploadError> Query() {
        StatusQuery query(transport_, config_);
        return query.Query(session_, cancel_);
    }

    MockHttpTransport transport_;
    UploaderConfig config_;
    CancellationToken cancel_;
    UploadSession session_;
};

TEST_F(StatusQueryTest, FinalStatusYieldsToken) {
    EXPECT_CALL(transport_, Perform(_, _))
        .WillOnce(Invoke([](const HttpRequest& request,
                            const CancellationToken&) {
            EXPECT_EQ(request.url, "https://upload.test/s/3");
            EXPECT_EQ(request.headers.at("X-Goog-Upload-Command"), "query");
            EXPECT_TRUE(request.body.empty());
            return Respond(200, {{"X-Goog-Upload-Status", "final"}}, "tok");
        }));

    const auto [ok, token, err] = Query();
    ASSERT_TRUE(ok) << UploadErrorToString(err);
    EXPECT_EQ(token, "tok");
}

TEST_F(StatusQueryTest, FinalStatusOn308YieldsToken) {
    EXPECT_CALL(transport_, Perform(_, _))
        .WillOnce(Return(Respond(308, {{"X-Goog-Upload-Status", "final"}}, "tok")));

    const auto [ok, token, err] = Query();
    ASSERT_TRUE(ok) << UploadErrorToString(err);
    EXPECT_EQ(token, "tok");
}

TEST_F(StatusQueryTest, EverythingElseIsIncomplete) {
    EXPECT_CALL(transport_, Perform(_, _))
        .WillOnce(Return(Respond(200, {{"X-Goog-Upload-Status", "active"}}, "tok")))
        .WillOnce(Return(Respond(200, {{"X-Goog-Upload-Status", "final"}}, "")))
        .WillOnce(Return(Respond(500, {{"X-Goog-Upload-Status", "final"}}, "tok")))
        .WillOnce(Return(Respond(404)))
        .WillOnce(Return(Fail(HttpTransport::ErrorCode::Network)));

    for (int i = 0; i < 5; ++i) {
        const auto [ok, token, err] = Query();
        EXPECT_FALSE(ok) << "response " << i;
        EXPECT_EQ(err.kind, UploadError::Kind::UploadIncomplete)
            << "response " << i;
        EXPECT_TRUE(token.empty());
    }
}

TEST_F(StatusQueryTest, CancellationIsPropagated) {
    EXPECT_CALL(transport_, Perform(_, _))
        .WillOnce(Return(Fail(HttpTransport::ErrorCode::Cancelled)));

    const auto [ok, token, err] = Query();
    EXPECT_FALSE(ok);
    EXPECT_EQ(err.kind, UploadError::Kind::Cancelled);
}
