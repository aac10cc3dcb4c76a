#include "WebhookHandler.hpp"
#include "Crypto.hpp"

#include "../config/Config.hpp"
#include "../debug/log.hpp"
#include "../helpers/RequestUtils.hpp"
#include "../logging/TrafficLogger.hpp"

#include <glaze/glaze.hpp>

constexpr const char* MESSAGE_CONFIG_ERROR   = "Configuration error";
constexpr const char* MESSAGE_BAD_METHOD     = "Method not allowed";
constexpr const char* MESSAGE_FORBIDDEN      = "Forbidden";
constexpr const char* MESSAGE_PUBLISH_FAILED = "Failed to process webhook";
constexpr const char* MESSAGE_INTERNAL_ERROR = "Internal server error";

struct SAcknowledgementJSON {
    std::string status = "ok";
    std::string messageId;
};

CWebhookHandler::CWebhookHandler(std::shared_ptr<const CConfig> config, std::shared_ptr<IPublisher> publisher, std::shared_ptr<CTrafficLogger> trafficLogger) :
    m_config(config), m_publisher(publisher), m_trafficLogger(trafficLogger), m_challenges(*config) {
    ;
}

int CWebhookHandler::codeForFailure(ePublishFailure failure) {
    switch (failure) {
        case PUBLISH_FAILURE_TIMEOUT:
        case PUBLISH_FAILURE_BROKER_UNAVAILABLE:
        case PUBLISH_FAILURE_BROKER_ERROR: return 502;
        case PUBLISH_FAILURE_INVALID_PAYLOAD:
        case PUBLISH_FAILURE_UNKNOWN: return 500;
    }

    return 500;
}

SHandlerResponse CWebhookHandler::handle(const SIncomingRequest& req) const {
    std::string      ip;
    eRequestAction   action = REQUEST_ACTION_NONE;
    SHandlerResponse response;

    try {
        response = handleInternal(req, ip, action);
    } catch (std::exception& e) {
        Debug::log(ERR, " | Action: ERROR ({})", e.what());
        action   = REQUEST_ACTION_INTERNAL_ERROR;
        response = SHandlerResponse{.code = 500, .body = MESSAGE_INTERNAL_ERROR};
    } catch (...) {
        Debug::log(ERR, " | Action: ERROR (unknown exception)");
        action   = REQUEST_ACTION_INTERNAL_ERROR;
        response = SHandlerResponse{.code = 500, .body = MESSAGE_INTERNAL_ERROR};
    }

    if (m_trafficLogger)
        m_trafficLogger->logTraffic(req, ip, action);

    return response;
}

SHandlerResponse CWebhookHandler::handleInternal(const SIncomingRequest& req, std::string& ip, eRequestAction& action) const {
    Debug::log(LOG, "New request: {} {}", req.method, req.resource);

    if (!m_config->valid()) {
        Debug::log(ERR, " | Action: ERROR (service is not configured, see startup log)");
        action = REQUEST_ACTION_CONFIG_ERROR;
        return {.code = 500, .body = MESSAGE_CONFIG_ERROR};
    }

    ip = NRequestUtils::ipForRequest(req, m_config->m_config.client_ip_header);

    Debug::log(LOG, " | Request author: IP {}, direct: {}", ip.empty() ? "<unknown>" : ip, req.peer);

    if (req.method != "POST") {
        Debug::log(LOG, " | Action: DENY (method {})", req.method);
        action = REQUEST_ACTION_BAD_METHOD;
        return {.code = 405, .body = MESSAGE_BAD_METHOD, .headers = {{"Allow", "POST"}}};
    }

    const auto& ALLOW_LIST = m_config->m_parsedConfigDatas.allowList;
    if (ALLOW_LIST.configured()) {
        if (ip.empty()) {
            Debug::log(LOG, " | Action: DENY (cannot verify origin)");
            action = REQUEST_ACTION_DENY;
            return {.code = 403, .body = MESSAGE_FORBIDDEN};
        }

        if (!ALLOW_LIST.isAllowed(ip)) {
            Debug::log(LOG, " | Action: DENY (IP {} not in allow list)", ip);
            action = REQUEST_ACTION_DENY;
            return {.code = 403, .body = MESSAGE_FORBIDDEN};
        }

        Debug::log(TRACE, "IP {} is in the allow list", ip);
    }

    if (const auto CHALLENGE = m_challenges.detect(req); CHALLENGE) {
        Debug::log(LOG, " | Action: CHALLENGE");
        action = REQUEST_ACTION_CHALLENGE;
        return {.code = 200, .body = CHALLENGE->body, .contentType = CHALLENGE->contentType};
    }

    return publish(req, action);
}

SHandlerResponse CWebhookHandler::publish(const SIncomingRequest& req, eRequestAction& action) const {
    const auto& TOPIC = m_config->m_parsedConfigDatas.topicPath;

    Debug::log(LOG, " | Payload: {} bytes, sha256 {}", req.body.size(), NCrypto::sha256(req.body));

    if (!m_publisher) {
        Debug::log(ERR, " | Action: PUBLISH FAILED (publisher is not initialized)");
        action = REQUEST_ACTION_PUBLISH_FAILED;
        return {.code = 500, .body = MESSAGE_INTERNAL_ERROR};
    }

    const auto OUTCOME = m_publisher->publish(TOPIC, req.body);

    if (!OUTCOME) {
        Debug::log(ERR, " | Action: PUBLISH FAILED ({}) to {}: {}", publishFailureToString(OUTCOME.error().cause), TOPIC, OUTCOME.error().detail);
        action = REQUEST_ACTION_PUBLISH_FAILED;
        return {.code = codeForFailure(OUTCOME.error().cause), .body = MESSAGE_PUBLISH_FAILED};
    }

    Debug::log(LOG, " | Action: PUBLISH ({}) to {}", *OUTCOME, TOPIC);
    action = REQUEST_ACTION_PUBLISH;

    auto json = glz::write_json(SAcknowledgementJSON{.messageId = *OUTCOME});
    if (!json.has_value())
        return {.code = 200, .body = "OK " + *OUTCOME};

    return {.code = 200, .body = json.value(), .contentType = "application/json"};
}
