#include <catch2/catch.hpp>

#include "core/PubSubPublisher.hpp"
#include "core/WebhookHandler.hpp"
#include "mocks/FakeServers.hpp"
#include "mocks/TestConfig.hpp"

#include <chrono>
#include <mutex>

// ============================================================================
// response mapping
// ============================================================================

TEST_CASE("message id is taken from the broker reply", "[publisher]") {
    const auto OUTCOME = CPubSubPublisher::outcomeForResponse(200, R"({"messageIds":["4451297316"]})");
    REQUIRE(OUTCOME.has_value());
    CHECK(*OUTCOME == "4451297316");
}

TEST_CASE("success without a message id is unknown", "[publisher]") {
    const auto EMPTY = CPubSubPublisher::outcomeForResponse(200, R"({"messageIds":[]})");
    REQUIRE_FALSE(EMPTY.has_value());
    CHECK(EMPTY.error().cause == PUBLISH_FAILURE_UNKNOWN);

    const auto GARBAGE = CPubSubPublisher::outcomeForResponse(200, "<html>proxy</html>");
    REQUIRE_FALSE(GARBAGE.has_value());
    CHECK(GARBAGE.error().cause == PUBLISH_FAILURE_UNKNOWN);
}

TEST_CASE("broker http errors are classified", "[publisher]") {
    const auto DENIED = CPubSubPublisher::outcomeForResponse(
        403, R"({"error":{"code":403,"message":"User not authorized to perform this action.","status":"PERMISSION_DENIED"}})");
    REQUIRE_FALSE(DENIED.has_value());
    CHECK(DENIED.error().cause == PUBLISH_FAILURE_BROKER_ERROR);
    CHECK(DENIED.error().detail.contains("PERMISSION_DENIED: User not authorized"));

    CHECK(CPubSubPublisher::outcomeForResponse(404, "").error().cause == PUBLISH_FAILURE_BROKER_ERROR);
    CHECK(CPubSubPublisher::outcomeForResponse(400, "").error().cause == PUBLISH_FAILURE_INVALID_PAYLOAD);
    CHECK(CPubSubPublisher::outcomeForResponse(429, "").error().cause == PUBLISH_FAILURE_BROKER_UNAVAILABLE);
    CHECK(CPubSubPublisher::outcomeForResponse(503, "upstream connect error").error().cause == PUBLISH_FAILURE_BROKER_UNAVAILABLE);
    CHECK(CPubSubPublisher::outcomeForResponse(503, "upstream connect error").error().detail.contains("upstream connect error"));
}

TEST_CASE("request body wraps the base64 payload", "[publisher]") {
    CHECK(CPubSubPublisher::requestBody(R"({"event":"x"})") == R"({"messages":[{"data":"eyJldmVudCI6IngifQ=="}]})");
    CHECK(CPubSubPublisher::requestBody("") == R"({"messages":[{"data":""}]})");
}

TEST_CASE("failure names", "[publisher]") {
    CHECK(std::string{publishFailureToString(PUBLISH_FAILURE_TIMEOUT)} == "timeout");
    CHECK(std::string{publishFailureToString(PUBLISH_FAILURE_BROKER_ERROR)} == "broker-error");
    CHECK(CWebhookHandler::codeForFailure(PUBLISH_FAILURE_TIMEOUT) == 502);
    CHECK(CWebhookHandler::codeForFailure(PUBLISH_FAILURE_UNKNOWN) == 500);
}

// ============================================================================
// against a local fake broker
// ============================================================================

TEST_CASE("publish against a fake broker", "[publisher][network]") {
    CFakeBrokerServer broker;

    SPubSubOptions    opts;
    opts.endpoint    = broker.endpoint();
    opts.tokens      = std::make_shared<CStaticTokenSource>("ya29.test");
    opts.timeout     = std::chrono::milliseconds(2000);
    CPubSubPublisher publisher(opts);

    const auto       OUTCOME = publisher.publish("projects/test-project/topics/webhook-events", R"({"event":"x"})");

    REQUIRE(OUTCOME.has_value());
    CHECK(*OUTCOME == "msg-1");

    std::lock_guard<std::mutex> lg(broker.state->mtx);
    CHECK(broker.state->requests == 1);
    CHECK(broker.state->lastResource == "/v1/projects/test-project/topics/webhook-events:publish");
    CHECK(broker.state->lastBody == R"({"messages":[{"data":"eyJldmVudCI6IngifQ=="}]})");
    CHECK(broker.state->lastAuthorization == "Bearer ya29.test");
}

TEST_CASE("broker error reply is not retried", "[publisher][network]") {
    CFakeBrokerServer broker;
    broker.state->code  = Pistache::Http::Code::Not_Found;
    broker.state->reply = R"({"error":{"code":404,"message":"Resource not found","status":"NOT_FOUND"}})";

    SPubSubOptions opts;
    opts.endpoint = broker.endpoint();
    opts.timeout  = std::chrono::milliseconds(2000);
    CPubSubPublisher publisher(opts);

    const auto       OUTCOME = publisher.publish("projects/test-project/topics/missing", "payload");

    REQUIRE_FALSE(OUTCOME.has_value());
    CHECK(OUTCOME.error().cause == PUBLISH_FAILURE_BROKER_ERROR);
    CHECK(OUTCOME.error().detail.contains("NOT_FOUND"));

    std::lock_guard<std::mutex> lg(broker.state->mtx);
    CHECK(broker.state->requests == 1);
}

TEST_CASE("slow broker times out", "[publisher][network]") {
    CFakeBrokerServer broker;
    broker.state->delay = std::chrono::milliseconds(1500);

    SPubSubOptions opts;
    opts.endpoint = broker.endpoint();
    opts.timeout  = std::chrono::milliseconds(200);
    CPubSubPublisher publisher(opts);

    const auto       BEGIN   = std::chrono::steady_clock::now();
    const auto       OUTCOME = publisher.publish("projects/test-project/topics/webhook-events", "payload");
    const auto       TOOK    = std::chrono::steady_clock::now() - BEGIN;

    REQUIRE_FALSE(OUTCOME.has_value());
    CHECK(OUTCOME.error().cause == PUBLISH_FAILURE_TIMEOUT);
    CHECK(TOOK < std::chrono::milliseconds(1500));
}

TEST_CASE("unreachable broker is unavailable", "[publisher][network]") {
    SPubSubOptions opts;
    // nothing listens on the discard port
    opts.endpoint = "http://127.0.0.1:9";
    opts.timeout  = std::chrono::milliseconds(1000);
    CPubSubPublisher publisher(opts);

    const auto       OUTCOME = publisher.publish("projects/test-project/topics/webhook-events", "payload");

    REQUIRE_FALSE(OUTCOME.has_value());
    CHECK((OUTCOME.error().cause == PUBLISH_FAILURE_BROKER_UNAVAILABLE || OUTCOME.error().cause == PUBLISH_FAILURE_TIMEOUT));
}

TEST_CASE("oversized payload is rejected before sending", "[publisher]") {
    SPubSubOptions opts;
    opts.endpoint = "http://127.0.0.1:9";
    CPubSubPublisher publisher(opts);

    const auto       OUTCOME = publisher.publish("projects/test-project/topics/webhook-events", std::string(10000001, 'a'));

    REQUIRE_FALSE(OUTCOME.has_value());
    CHECK(OUTCOME.error().cause == PUBLISH_FAILURE_INVALID_PAYLOAD);
}

TEST_CASE("publisher handle is created once", "[publisher]") {
    const CConfig CONFIG(validConfig());

    const auto    FIRST  = NPublisher::initialize(CONFIG);
    const auto    SECOND = NPublisher::initialize(CONFIG);

    REQUIRE(FIRST != nullptr);
    CHECK(FIRST == SECOND);
}

TEST_CASE("url joins endpoint and topic path", "[publisher]") {
    SPubSubOptions opts;
    opts.endpoint = "http://localhost:8085/";
    CPubSubPublisher publisher(opts);
    CHECK(publisher.urlFor("projects/p/topics/t") == "http://localhost:8085/v1/projects/p/topics/t:publish");
}

TEST_CASE("publisher is not created without a valid config", "[publisher]") {
    const CConfig CONFIG(CConfig::SConfig{});
    CHECK(NPublisher::initialize(CONFIG) == nullptr);
}

TEST_CASE("https endpoint builds the same url", "[publisher]") {
    SPubSubOptions opts;
    CPubSubPublisher publisher(opts);
    CHECK(publisher.urlFor("projects/p/topics/t") == "https://pubsub.googleapis.com/v1/projects/p/topics/t:publish");
}

TEST_CASE("unreachable https broker is unavailable", "[publisher][network]") {
    SPubSubOptions opts;
    opts.endpoint = "https://127.0.0.1:9";
    opts.tokens   = std::make_shared<CStaticTokenSource>("ya29.test");
    opts.timeout  = std::chrono::milliseconds(1000);
    CPubSubPublisher publisher(opts);

    const auto       OUTCOME = publisher.publish("projects/test-project/topics/webhook-events", "payload");

    REQUIRE_FALSE(OUTCOME.has_value());
    CHECK((OUTCOME.error().cause == PUBLISH_FAILURE_BROKER_UNAVAILABLE || OUTCOME.error().cause == PUBLISH_FAILURE_TIMEOUT));
}

TEST_CASE("plain http server is not mistaken for a TLS broker", "[publisher][network]") {
    CFakeBrokerServer broker;

    SPubSubOptions    opts;
    opts.endpoint = "https://127.0.0.1:" + broker.endpoint().substr(broker.endpoint().rfind(':') + 1);
    opts.timeout  = std::chrono::milliseconds(1000);
    CPubSubPublisher publisher(opts);

    const auto       OUTCOME = publisher.publish("projects/test-project/topics/webhook-events", "payload");

    REQUIRE_FALSE(OUTCOME.has_value());
    CHECK((OUTCOME.error().cause == PUBLISH_FAILURE_BROKER_UNAVAILABLE || OUTCOME.error().cause == PUBLISH_FAILURE_TIMEOUT));
}

// ============================================================================
// credentials
// ============================================================================

// counts how often the publisher asks for a token and drops it
class CCountingTokenSource : public ITokenSource {
  public:
    virtual std::expected<std::string, std::string> token() {
        std::lock_guard<std::mutex> lg(mtx);
        if (failing)
            return std::unexpected("metadata server unreachable");
        return fmt::format("tok-{}", generation);
    }

    virtual void invalidate() {
        std::lock_guard<std::mutex> lg(mtx);
        invalidations++;
        generation++;
    }

    std::mutex mtx;
    bool       failing       = false;
    int        generation    = 1;
    int        invalidations = 0;
};

TEST_CASE("rejected token is dropped for the next publish", "[publisher][network]") {
    CFakeBrokerServer broker;
    broker.state->code  = Pistache::Http::Code::Unauthorized;
    broker.state->reply = R"({"error":{"code":401,"message":"Request had invalid authentication credentials.","status":"UNAUTHENTICATED"}})";

    auto           tokens = std::make_shared<CCountingTokenSource>();

    SPubSubOptions opts;
    opts.endpoint = broker.endpoint();
    opts.tokens   = tokens;
    opts.timeout  = std::chrono::milliseconds(2000);
    CPubSubPublisher publisher(opts);

    const auto       REJECTED = publisher.publish("projects/test-project/topics/webhook-events", "payload");
    REQUIRE_FALSE(REJECTED.has_value());
    CHECK(REJECTED.error().cause == PUBLISH_FAILURE_BROKER_ERROR);
    CHECK(tokens->invalidations == 1);

    {
        std::lock_guard<std::mutex> lg(broker.state->mtx);
        CHECK(broker.state->lastAuthorization == "Bearer tok-1");
        broker.state->code  = Pistache::Http::Code::Ok;
        broker.state->reply = R"({"messageIds":["msg-2"]})";
    }

    const auto ACCEPTED = publisher.publish("projects/test-project/topics/webhook-events", "payload");
    REQUIRE(ACCEPTED.has_value());
    CHECK(*ACCEPTED == "msg-2");

    std::lock_guard<std::mutex> lg(broker.state->mtx);
    CHECK(broker.state->lastAuthorization == "Bearer tok-2");
}

TEST_CASE("missing token fails without contacting the broker", "[publisher][network]") {
    CFakeBrokerServer broker;

    auto              tokens = std::make_shared<CCountingTokenSource>();
    tokens->failing          = true;

    SPubSubOptions opts;
    opts.endpoint = broker.endpoint();
    opts.tokens   = tokens;
    CPubSubPublisher publisher(opts);

    const auto       OUTCOME = publisher.publish("projects/test-project/topics/webhook-events", "payload");

    REQUIRE_FALSE(OUTCOME.has_value());
    CHECK(OUTCOME.error().cause == PUBLISH_FAILURE_BROKER_UNAVAILABLE);
    CHECK(OUTCOME.error().detail.contains("access token"));

    std::lock_guard<std::mutex> lg(broker.state->mtx);
    CHECK(broker.state->requests == 0);
}
