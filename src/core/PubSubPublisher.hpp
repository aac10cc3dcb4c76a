#pragma once

#include "Publisher.hpp"
#include "HttpClient.hpp"
#include "TokenSource.hpp"

#include <chrono>
#include <string>
#include <memory>

#include <pistache/client.h>

struct SPubSubOptions {
    std::string                   endpoint = "https://pubsub.googleapis.com";
    // no token source: requests go out without Authorization, as the emulator expects
    std::shared_ptr<ITokenSource> tokens;
    std::chrono::milliseconds     timeout{5000};
    size_t                        maxResponseSize = 1024 * 1024;
};

/*
    Publishes through the Pub/Sub REST API:
      POST {endpoint}/v1/{topicPath}:publish
      {"messages":[{"data":"<base64>"}]}  ->  {"messageIds":["..."]}

    https endpoints go through OpenSSL, one connection per publish.
    http endpoints (the emulator) share one long-lived Pistache client.
*/
class CPubSubPublisher : public IPublisher {
  public:
    CPubSubPublisher(const SPubSubOptions& opts);
    virtual ~CPubSubPublisher();

    CPubSubPublisher(const CPubSubPublisher&)            = delete;
    CPubSubPublisher& operator=(const CPubSubPublisher&) = delete;

    virtual PublishOutcome publish(const std::string& topicPath, const std::string& payload);

    // maps a broker HTTP reply to an outcome, no I/O
    static PublishOutcome  outcomeForResponse(int code, const std::string& body);
    static std::string     requestBody(const std::string& payload);
    std::string            urlFor(const std::string& topicPath) const;

  private:
    HttpOutcome                                           sendPlain(const std::string& url, const std::string& body, const std::string& bearer,
                                                                    std::chrono::milliseconds timeout);

    SPubSubOptions                                        m_opts;
    std::unique_ptr<Pistache::Http::Experimental::Client> m_client;
};
