#include "Publisher.hpp"
#include "PubSubPublisher.hpp"

#include "../config/Config.hpp"
#include "../debug/log.hpp"

#include <mutex>

const char* publishFailureToString(ePublishFailure f) {
    switch (f) {
        case PUBLISH_FAILURE_TIMEOUT: return "timeout";
        case PUBLISH_FAILURE_BROKER_UNAVAILABLE: return "broker-unavailable";
        case PUBLISH_FAILURE_BROKER_ERROR: return "broker-error";
        case PUBLISH_FAILURE_INVALID_PAYLOAD: return "invalid-payload";
        case PUBLISH_FAILURE_UNKNOWN: return "unknown";
    }

    return "unknown";
}

std::shared_ptr<IPublisher> NPublisher::initialize(const CConfig& config) {
    static std::once_flag              once;
    static std::shared_ptr<IPublisher> publisher;

    if (!config.valid()) {
        Debug::log(CRIT, "Refusing to initialize the publisher without a valid project and topic");
        return nullptr;
    }

    std::call_once(once, [&config]() {
        const auto&    CFG = config.m_config;

        SPubSubOptions opts;
        opts.endpoint = CFG.pubsub_endpoint;
        opts.timeout  = std::chrono::milliseconds(CFG.publish_timeout_ms);

        if (!CFG.access_token.empty()) {
            opts.tokens = std::make_shared<CStaticTokenSource>(CFG.access_token);
            Debug::log(LOG, "Pub/Sub credentials: configured access token");
        } else if (opts.endpoint.starts_with("https://")) {
            auto metadata = std::make_shared<CMetadataTokenSource>(CFG.metadata_endpoint, opts.timeout);
            Debug::log(LOG, "Pub/Sub credentials: service account tokens from {}", metadata->url());
            opts.tokens = metadata;
        } else
            Debug::log(LOG, "Pub/Sub credentials: none (emulator)");

        Debug::log(LOG, "Initializing Pub/Sub publisher for {} via {}", config.m_parsedConfigDatas.topicPath, opts.endpoint);

        publisher = std::make_shared<CPubSubPublisher>(opts);
    });

    return publisher;
}
