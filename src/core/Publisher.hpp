#pragma once

#include <string>
#include <memory>
#include <expected>
#include <cstdint>

enum ePublishFailure : uint8_t {
    PUBLISH_FAILURE_TIMEOUT = 0,
    PUBLISH_FAILURE_BROKER_UNAVAILABLE,
    PUBLISH_FAILURE_BROKER_ERROR,
    PUBLISH_FAILURE_INVALID_PAYLOAD,
    PUBLISH_FAILURE_UNKNOWN,
};

struct SPublishError {
    ePublishFailure cause = PUBLISH_FAILURE_UNKNOWN;
    // for server-side logs only, never sent to the caller
    std::string detail;
};

// message id on success
using PublishOutcome = std::expected<std::string, SPublishError>;

const char* publishFailureToString(ePublishFailure f);

// The broker seam. Implementations must be safe to call from several handler threads at once
// and must never throw.
class IPublisher {
  public:
    virtual ~IPublisher() = default;

    virtual PublishOutcome publish(const std::string& topicPath, const std::string& payload) = 0;
};

class CConfig;

namespace NPublisher {
    // Creates the process-wide broker client. Only the first call constructs anything,
    // later calls return the same handle.
    std::shared_ptr<IPublisher> initialize(const CConfig& config);
};
