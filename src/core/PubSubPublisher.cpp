#include "PubSubPublisher.hpp"
#include "Crypto.hpp"
#include "TlsClient.hpp"

#include "../headers/authorization.hpp"
#include "../debug/log.hpp"

#include <fmt/format.h>
#include <glaze/glaze.hpp>
#include <pistache/http.h>
#include <pistache/mime.h>

// Pub/Sub rejects message data above 10MB
constexpr const size_t MAX_MESSAGE_BYTES = 10000000;
// keep broker error bodies short in logs
constexpr const size_t MAX_ERROR_DETAIL = 256;

struct SPublishRequestJSON {
    struct SMessage {
        std::string data;
    };

    std::vector<SMessage> messages;
};

struct SPublishResponseJSON {
    std::vector<std::string> messageIds;
};

struct SGoogleErrorJSON {
    struct {
        int         code = 0;
        std::string message;
        std::string status;
    } error;
};

CPubSubPublisher::CPubSubPublisher(const SPubSubOptions& opts) : m_opts(opts) {
    if (m_opts.endpoint.starts_with("https://"))
        return;

    m_client = std::make_unique<Pistache::Http::Experimental::Client>();
    m_client->init(Pistache::Http::Experimental::Client::options().threads(1).maxConnectionsPerHost(16).maxResponseSize(m_opts.maxResponseSize));
}

CPubSubPublisher::~CPubSubPublisher() {
    if (m_client)
        m_client->shutdown();
}

std::string CPubSubPublisher::urlFor(const std::string& topicPath) const {
    std::string endpoint = m_opts.endpoint;
    while (endpoint.ends_with("/"))
        endpoint.pop_back();

    return fmt::format("{}/v1/{}:publish", endpoint, topicPath);
}

std::string CPubSubPublisher::requestBody(const std::string& payload) {
    SPublishRequestJSON req;
    req.messages.emplace_back(SPublishRequestJSON::SMessage{NCrypto::base64Encode(payload)});

    auto json = glz::write_json(req);
    if (!json.has_value())
        return "";

    return json.value();
}

PublishOutcome CPubSubPublisher::outcomeForResponse(int code, const std::string& body) {
    if (code >= 200 && code < 300) {
        SPublishResponseJSON resp;
        const auto           ERR = glz::read<glz::opts{.error_on_unknown_keys = false}>(resp, body);

        if (ERR || resp.messageIds.empty() || resp.messageIds.front().empty())
            return std::unexpected(SPublishError{PUBLISH_FAILURE_UNKNOWN, fmt::format("broker replied {} without a message id", code)});

        return resp.messageIds.front();
    }

    std::string      detail = body.substr(0, MAX_ERROR_DETAIL);
    SGoogleErrorJSON googleError;
    if (!glz::read<glz::opts{.error_on_unknown_keys = false}>(googleError, body) && !googleError.error.message.empty())
        detail = googleError.error.status.empty() ? googleError.error.message : fmt::format("{}: {}", googleError.error.status, googleError.error.message);

    detail = fmt::format("broker replied {}: {}", code, detail);

    if (code == 400)
        return std::unexpected(SPublishError{PUBLISH_FAILURE_INVALID_PAYLOAD, detail});

    if (code == 429 || code >= 500)
        return std::unexpected(SPublishError{PUBLISH_FAILURE_BROKER_UNAVAILABLE, detail});

    return std::unexpected(SPublishError{PUBLISH_FAILURE_BROKER_ERROR, detail});
}

HttpOutcome CPubSubPublisher::sendPlain(const std::string& url, const std::string& body, const std::string& bearer, std::chrono::milliseconds timeout) {
    auto builder = m_client->post(url);
    builder.body(body);
    builder.header<Pistache::Http::Header::ContentType>(MIME(Application, Json));

    if (!bearer.empty()) {
        auto auth = std::make_shared<AuthorizationHeader>();
        auth->parse("Bearer " + bearer);
        builder.header(auth);
    }

    return NHttpClient::send(builder, timeout);
}

PublishOutcome CPubSubPublisher::publish(const std::string& topicPath, const std::string& payload) {
    if (payload.size() > MAX_MESSAGE_BYTES)
        return std::unexpected(SPublishError{PUBLISH_FAILURE_INVALID_PAYLOAD, fmt::format("payload of {} bytes exceeds {} bytes", payload.size(), MAX_MESSAGE_BYTES)});

    const auto BODY = requestBody(payload);
    if (BODY.empty())
        return std::unexpected(SPublishError{PUBLISH_FAILURE_UNKNOWN, "couldn't encode publish request"});

    // token fetch and broker request share one budget
    const auto  DEADLINE = std::chrono::steady_clock::now() + m_opts.timeout;

    std::string bearer;
    if (m_opts.tokens) {
        const auto TOKEN = m_opts.tokens->token();
        if (!TOKEN)
            return std::unexpected(SPublishError{PUBLISH_FAILURE_BROKER_UNAVAILABLE, fmt::format("couldn't get an access token: {}", TOKEN.error())});
        bearer = *TOKEN;
    }

    const auto REMAINING = std::chrono::duration_cast<std::chrono::milliseconds>(DEADLINE - std::chrono::steady_clock::now());
    if (REMAINING.count() <= 0)
        return std::unexpected(SPublishError{PUBLISH_FAILURE_TIMEOUT, fmt::format("no time left within {}ms after getting a token", m_opts.timeout.count())});

    const auto URL = urlFor(topicPath);

    Debug::log(TRACE, "Publishing {} bytes to {}", payload.size(), URL);

    HttpOutcome reply;
    if (!m_client) {
        std::vector<std::pair<std::string, std::string>> headers{{"Content-Type", "application/json"}};
        if (!bearer.empty())
            headers.emplace_back("Authorization", "Bearer " + bearer);

        reply = NTlsClient::post(URL, headers, BODY, REMAINING, m_opts.maxResponseSize);
    } else
        reply = sendPlain(URL, BODY, bearer, REMAINING);

    if (!reply)
        return std::unexpected(
            SPublishError{reply.error().timedOut ? PUBLISH_FAILURE_TIMEOUT : PUBLISH_FAILURE_BROKER_UNAVAILABLE, fmt::format("request failed: {}", reply.error().what)});

    if (reply->code == 401 && m_opts.tokens) {
        Debug::log(WARN, "Broker rejected the access token, a new one is fetched for the next publish");
        m_opts.tokens->invalidate();
    }

    return outcomeForResponse(reply->code, reply->body);
}
