#pragma once

#include <cstdint>

enum eAllInvalidPolicy : uint8_t {
    ALL_INVALID_ALLOW = 0,
    ALL_INVALID_DENY,
};

enum eChallengeReply : uint8_t {
    CHALLENGE_REPLY_BODY = 0,
    CHALLENGE_REPLY_TOKEN,
    CHALLENGE_REPLY_JSON,
};

// what the handler did with a request, used for logging
enum eRequestAction : uint8_t {
    REQUEST_ACTION_NONE = 0,
    REQUEST_ACTION_PUBLISH,
    REQUEST_ACTION_CHALLENGE,
    REQUEST_ACTION_DENY,
    REQUEST_ACTION_BAD_METHOD,
    REQUEST_ACTION_CONFIG_ERROR,
    REQUEST_ACTION_PUBLISH_FAILED,
    REQUEST_ACTION_INTERNAL_ERROR,
};
