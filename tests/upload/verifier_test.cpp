#include "stash/upload/verifier.hpp"

#include "support/mock_transport.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
using stash::ErrorKind;
using stash::testing::MockTransport;
using stash::testing::RecordedRequest;
using stash::testing::respond;
using stash::upload::ApiClient;
using stash::upload::FinishedPartReceipt;
using stash::upload::UploadVerifier;

namespace {

constexpr const char* kVerified = R"({
    "message": "Build uploaded",
    "build_id": "b_1",
    "pending_processing": false,
    "build_info_url": "https://app.example.com/b_1",
    "download_url": "https://app.example.com/b_1/dl"
})";

stash::config::ApiConfig api_config(bool receipts) {
    stash::config::ApiConfig config;
    config.base_url = "https://api.example.com/api/v1";
    config.api_key = "secret";
    config.send_part_receipts = receipts;
    return config;
}

} // namespace

TEST(UploadVerifierTest, PostsPendingIdAndParsesRecord) {
    MockTransport transport([](const RecordedRequest&) { return respond(200, kVerified); });
    ApiClient api(transport, api_config(false));
    UploadVerifier verifier(api);

    std::vector<FinishedPartReceipt> receipts{{1, "\"a\""}};
    auto record = verifier.verify("pu_5", receipts);
    ASSERT_TRUE(record.is_ok()) << record.error().describe();
    EXPECT_EQ(record.value().build_id, "b_1");
    EXPECT_EQ(record.value().download_url, "https://app.example.com/b_1/dl");

    const auto requests = transport.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].url, "https://api.example.com/api/v1/upload/verify");
    EXPECT_EQ(requests[0].header("Authorization"), "Bearer secret");
    // receipts stay local unless configured
    EXPECT_EQ(json::parse(requests[0].body), (json{{"pending_upload_id", "pu_5"}}));
}

TEST(UploadVerifierTest, SendsReceiptsWhenConfigured) {
    MockTransport transport([](const RecordedRequest&) { return respond(200, kVerified); });
    ApiClient api(transport, api_config(true));
    UploadVerifier verifier(api);

    std::vector<FinishedPartReceipt> primary{{1, "\"a\""}, {2, "\"b\""}};
    std::vector<FinishedPartReceipt> expansion{{1, "\"c\""}};
    ASSERT_TRUE(verifier.verify("pu_5", primary, expansion).is_ok());

    auto body = json::parse(transport.requests().front().body);
    EXPECT_EQ(body["primary_file_parts"].size(), 2u);
    EXPECT_EQ(body["expansion_file_parts"][0]["etag"], "\"c\"");
}

TEST(UploadVerifierTest, NonSuccessIsProtocolErrorWithBody) {
    MockTransport transport([](const RecordedRequest&) {
        return respond(409, R"({"message": "Upload incomplete"})");
    });
    ApiClient api(transport, api_config(false));
    UploadVerifier verifier(api);

    auto record = verifier.verify("pu_5");
    ASSERT_TRUE(record.is_error());
    EXPECT_EQ(record.error().kind, ErrorKind::Protocol);
    EXPECT_EQ(record.error().status_code, 409);
    EXPECT_EQ(record.error().body, R"({"message": "Upload incomplete"})");
}

TEST(UploadVerifierTest, UnparseableBodyIsProtocolError) {
    MockTransport transport([](const RecordedRequest&) { return respond(200, "{not json"); });
    ApiClient api(transport, api_config(false));
    UploadVerifier verifier(api);

    auto record = verifier.verify("pu_5");
    ASSERT_TRUE(record.is_error());
    EXPECT_EQ(record.error().kind, ErrorKind::Protocol);
    EXPECT_NE(record.error().message.find("Failed to parse"), std::string::npos);
}
