// EN: Unit tests for HttpReleaseEndpoint against a mocked HTTP transport
// FR: Tests unitaires pour HttpReleaseEndpoint avec un transport HTTP simulé

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "orchestrator/http_release_endpoint.hpp"
#include "infrastructure/logging/logger.hpp"

#include <nlohmann/json.hpp>

using namespace CDO;
using namespace CDO::Orchestrator;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Field;
using ::testing::Invoke;
using ::testing::InSequence;
using ::testing::Return;

namespace {

class MockTransport : public HttpTransport {
public:
    MOCK_METHOD(HttpResponse, perform, (const HttpRequest& request), (override));
};

HttpResponse respond(int status, const std::string& body = "") {
    HttpResponse response;
    response.status = status;
    response.body = body;
    return response;
}

} // namespace

class HttpReleaseEndpointTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setConsoleOutput(false);
        ErrorRecoveryManager::getInstance().resetCircuitBreaker();
        ErrorRecoveryManager::getInstance().setDetailedLogging(false);

        config_.base_url = "https://api.example.com/repos/acme/app/";
        config_.upload_url = "https://uploads.example.com/repos/acme/app";
        config_.headers = {{"Authorization", "Bearer token"}};
        config_.retry.max_attempts = 3;
        config_.retry.initial_delay = 1ms;
        config_.retry.max_delay = 5ms;
        config_.retry.enable_jitter = false;
    }

    void TearDown() override {
        ErrorRecoveryManager::getInstance().resetCircuitBreaker();
    }

    MockTransport transport_;
    HttpReleaseEndpointConfig config_;
    CancellationSource cancellation_;
};

TEST_F(HttpReleaseEndpointTest, CreateReleaseStagesADraft) {
    HttpRequest captured;
    EXPECT_CALL(transport_, perform(_)).WillOnce(Invoke([&captured](const HttpRequest& request) {
        captured = request;
        return respond(201, R"({"id": 42, "name": "Release v1", "tag_name": "v1", "draft": true})");
    }));

    HttpReleaseEndpoint endpoint(transport_, config_);
    auto record = endpoint.createRelease(ReleaseMetadata{"Release v1", "v1", "notes", false, false},
                                         cancellation_.token());

    EXPECT_EQ(record.id, "42");
    EXPECT_TRUE(record.staged);
    EXPECT_EQ(record.metadata.tag, "v1");

    EXPECT_EQ(captured.method, "POST");
    EXPECT_EQ(captured.url, "https://api.example.com/repos/acme/app/releases");
    EXPECT_EQ(captured.headers["Content-Type"], "application/json");
    EXPECT_EQ(captured.headers["Authorization"], "Bearer token");
    EXPECT_EQ(captured.headers["Accept"], "application/vnd.github+json");
    ASSERT_TRUE(captured.body.has_value());
    auto payload = nlohmann::json::parse(*captured.body);
    EXPECT_TRUE(payload["draft"].get<bool>());
    EXPECT_EQ(payload["tag_name"], "v1");
    EXPECT_EQ(payload["body"], "notes");
}

// EN: A staged release stays invisible to lookups until it is finalized
// FR: Une release préparée reste invisible aux recherches jusqu'à sa finalisation
TEST_F(HttpReleaseEndpointTest, FindIgnoresStagedReleasesUntilFinalized) {
    const std::string listing =
        R"([{"id": 7, "name": "Release v1", "tag_name": "v1", "draft": false, "assets": [{"name": "app.tar.gz"}]}])";
    {
        InSequence sequence;
        EXPECT_CALL(transport_, perform(Field(&HttpRequest::method, "POST")))
            .WillOnce(Return(respond(201, R"({"id": 7, "name": "Release v1", "tag_name": "v1", "draft": true})")));
        EXPECT_CALL(transport_, perform(Field(&HttpRequest::method, "GET"))).WillOnce(Return(respond(200, listing)));
        EXPECT_CALL(transport_, perform(Field(&HttpRequest::method, "PATCH"))).WillOnce(Return(respond(200, "{}")));
        EXPECT_CALL(transport_, perform(Field(&HttpRequest::method, "GET"))).WillOnce(Return(respond(200, listing)));
    }

    HttpReleaseEndpoint endpoint(transport_, config_);
    const ReleaseMetadata metadata{"Release v1", "v1", "", false, false};
    endpoint.createRelease(metadata, cancellation_.token());
    EXPECT_FALSE(endpoint.findRelease("Release v1", "v1", cancellation_.token()).has_value());

    endpoint.finalizeRelease("7", metadata, cancellation_.token());
    auto found = endpoint.findRelease("Release v1", "v1", cancellation_.token());
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, "7");
    ASSERT_EQ(found->assets.size(), 1u);
    EXPECT_EQ(found->assets[0], "app.tar.gz");
}

TEST_F(HttpReleaseEndpointTest, FindMatchesNameAndTag) {
    EXPECT_CALL(transport_, perform(Field(&HttpRequest::url,
                                          "https://api.example.com/repos/acme/app/releases?per_page=100")))
        .WillRepeatedly(Return(respond(200, R"([{"id": "a", "name": "Nightly", "tag_name": "v1"},
                                               {"id": "b", "name": "Release v1", "tag_name": "v1", "body": null}])")));

    HttpReleaseEndpoint endpoint(transport_, config_);
    auto found = endpoint.findRelease("Release v1", "v1", cancellation_.token());
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, "b");
    EXPECT_TRUE(found->metadata.body.empty());
    EXPECT_FALSE(endpoint.findRelease("Release v2", "v2", cancellation_.token()).has_value());
}

// EN: Lookups follow the Link header until the release is found or no next page remains
// FR: Les recherches suivent le header Link jusqu'à trouver la release ou épuiser les pages
TEST_F(HttpReleaseEndpointTest, FindFollowsPagination) {
    const std::string first_page = "https://api.example.com/repos/acme/app/releases?per_page=100";
    const std::string second_page = "https://api.example.com/repos/acme/app/releases?per_page=100&page=2";

    HttpResponse first = respond(200, R"([{"id": 1, "name": "Release v9", "tag_name": "v9"}])");
    first.headers["link"] = "<" + second_page + ">; rel=\"next\", <" + second_page + ">; rel=\"last\"";
    HttpResponse second = respond(200, R"([{"id": 2, "name": "Release v1", "tag_name": "v1"}])");
    second.headers["Link"] = "<" + first_page + ">; rel=\"prev\", <" + first_page + ">; rel=\"first\"";

    EXPECT_CALL(transport_, perform(Field(&HttpRequest::url, first_page))).Times(2).WillRepeatedly(Return(first));
    EXPECT_CALL(transport_, perform(Field(&HttpRequest::url, second_page))).Times(2).WillRepeatedly(Return(second));

    HttpReleaseEndpoint endpoint(transport_, config_);
    auto found = endpoint.findRelease("Release v1", "v1", cancellation_.token());
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, "2");

    EXPECT_FALSE(endpoint.findRelease("Release v5", "v5", cancellation_.token()).has_value());
}

TEST(HttpReleaseLinkTest, ExtractsNextPage) {
    EXPECT_EQ(HttpReleaseEndpoint::nextPageUrl({{"Link", "<https://h/r?page=3>; rel=\"next\", "
                                                          "<https://h/r?page=9>; rel=\"last\""}})
                  .value_or(""),
              "https://h/r?page=3");
    EXPECT_EQ(HttpReleaseEndpoint::nextPageUrl({{"link", "<https://h/r?page=1>; rel=\"prev\", "
                                                          "<https://h/r?page=4>; rel=\"next\""}})
                  .value_or(""),
              "https://h/r?page=4");
    EXPECT_FALSE(HttpReleaseEndpoint::nextPageUrl({{"Link", "<https://h/r?page=1>; rel=\"first\""}}).has_value());
    EXPECT_FALSE(HttpReleaseEndpoint::nextPageUrl({}).has_value());
}

TEST_F(HttpReleaseEndpointTest, UploadSendsRawContentUnderFileName) {
    HttpRequest captured;
    EXPECT_CALL(transport_, perform(_)).WillOnce(Invoke([&captured](const HttpRequest& request) {
        captured = request;
        return respond(201, "{}");
    }));

    HttpReleaseEndpoint endpoint(transport_, config_);
    endpoint.uploadAsset("42", Artifact{"dist/app linux.tar.gz", "payload", "build"}, cancellation_.token());

    EXPECT_EQ(captured.method, "POST");
    EXPECT_EQ(captured.url, "https://uploads.example.com/repos/acme/app/releases/42/assets?name=app%20linux.tar.gz");
    EXPECT_EQ(captured.headers["Content-Type"], "application/octet-stream");
    EXPECT_EQ(captured.body.value_or(""), "payload");
}

TEST_F(HttpReleaseEndpointTest, ServerErrorsAreRetried) {
    {
        InSequence sequence;
        EXPECT_CALL(transport_, perform(_)).WillOnce(Return(respond(503)));
        EXPECT_CALL(transport_, perform(_)).WillOnce(Return(respond(200, "{}")));
    }

    HttpReleaseEndpoint endpoint(transport_, config_);
    EXPECT_NO_THROW(endpoint.updateRelease("42", ReleaseMetadata{"R", "v1", "", true, false}, cancellation_.token()));
}

TEST_F(HttpReleaseEndpointTest, PersistentServerErrorExhaustsRetries) {
    EXPECT_CALL(transport_, perform(_)).Times(3).WillRepeatedly(Return(respond(502)));

    HttpReleaseEndpoint endpoint(transport_, config_);
    EXPECT_THROW(endpoint.uploadAsset("42", Artifact{"a.zip", "x", ""}, cancellation_.token()),
                 RetryExhaustedException);
}

TEST_F(HttpReleaseEndpointTest, ClientErrorIsNotRetried) {
    EXPECT_CALL(transport_, perform(_)).Times(1).WillOnce(Return(respond(422, R"({"message": "already_exists"})")));

    HttpReleaseEndpoint endpoint(transport_, config_);
    EXPECT_THROW(endpoint.createRelease(ReleaseMetadata{"R", "v1", "", false, false}, cancellation_.token()),
                 NonRecoverableError);
}

TEST_F(HttpReleaseEndpointTest, DeleteToleratesMissingRelease) {
    EXPECT_CALL(transport_, perform(Field(&HttpRequest::method, "DELETE"))).WillOnce(Return(respond(404)));

    HttpReleaseEndpoint endpoint(transport_, config_);
    EXPECT_NO_THROW(endpoint.deleteRelease("42", cancellation_.token()));
}

TEST_F(HttpReleaseEndpointTest, CancellationAbortsRetryWait) {
    config_.retry.initial_delay = 2000ms;
    config_.retry.max_delay = 2000ms;
    EXPECT_CALL(transport_, perform(_)).Times(1).WillOnce(Return(respond(500)));

    HttpReleaseEndpoint endpoint(transport_, config_);
    cancellation_.cancel();
    const auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(endpoint.deleteRelease("42", cancellation_.token()), RetryAbortedException);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1500ms);
}

TEST_F(HttpReleaseEndpointTest, MalformedPayloadIsReported) {
    EXPECT_CALL(transport_, perform(_)).WillOnce(Return(respond(200, "<html>")));

    HttpReleaseEndpoint endpoint(transport_, config_);
    EXPECT_THROW(endpoint.findRelease("R", "v1", cancellation_.token()), std::runtime_error);
}

TEST(HttpReleaseUrlTest, EncodesReservedCharacters) {
    EXPECT_EQ(HttpReleaseEndpoint::urlEncode("app-1.0_x~y.zip"), "app-1.0_x~y.zip");
    EXPECT_EQ(HttpReleaseEndpoint::urlEncode("a b/c+d"), "a%20b%2Fc%2Bd");
}
