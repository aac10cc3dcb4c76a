#pragma once

#include <chrono>
#include <expected>
#include <string>

#include <pistache/client.h>

struct SHttpReply {
    int         code = 0;
    std::string body;
};

struct STransportError {
    bool        timedOut = false;
    std::string what;
};

using HttpOutcome = std::expected<SHttpReply, STransportError>;

namespace NHttpClient {
    // Sends a prepared Pistache request and waits at most timeout for the reply.
    // A reply arriving later is dropped.
    HttpOutcome send(Pistache::Http::Experimental::RequestBuilder& builder, std::chrono::milliseconds timeout);
};
