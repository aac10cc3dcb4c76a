#pragma once

#include "HttpClient.hpp"

#include <chrono>
#include <expected>
#include <string>
#include <utility>
#include <vector>

/*
    HTTPS/1.1 over OpenSSL, one connection per request.
    Pistache's client only speaks plain http, this covers https://pubsub.googleapis.com.
    The peer certificate is verified against the system CA store and the url's host.
*/
namespace NTlsClient {
    HttpOutcome post(const std::string& url, const std::vector<std::pair<std::string, std::string>>& headers, const std::string& body,
                     std::chrono::milliseconds timeout, size_t maxResponseSize);

    // status line, headers and a Content-Length, chunked or read-to-close body
    std::expected<SHttpReply, std::string> parseResponse(const std::string& raw);
};
