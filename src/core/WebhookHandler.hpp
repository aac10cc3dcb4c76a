#pragma once

#include <memory>
#include <string>

#include "Request.hpp"
#include "Challenge.hpp"
#include "Publisher.hpp"
#include "../config/ConfigTypes.hpp"

class CConfig;
class CTrafficLogger;

/*
    Per-request pipeline:
      config check -> method check -> ip filter -> challenge short-circuit -> publish

    Holds no mutable state, handle() may run on any number of threads at once.
    Every failure is mapped to a response here, nothing is thrown to the caller.
*/
class CWebhookHandler {
  public:
    // publisher and trafficLogger may be null, a null publisher fails every publish
    CWebhookHandler(std::shared_ptr<const CConfig> config, std::shared_ptr<IPublisher> publisher, std::shared_ptr<CTrafficLogger> trafficLogger = nullptr);

    SHandlerResponse handle(const SIncomingRequest& req) const;

    // the http status a publish failure is reported with
    static int       codeForFailure(ePublishFailure failure);

  private:
    SHandlerResponse handleInternal(const SIncomingRequest& req, std::string& ip, eRequestAction& action) const;
    SHandlerResponse publish(const SIncomingRequest& req, eRequestAction& action) const;

    std::shared_ptr<const CConfig>  m_config;
    std::shared_ptr<IPublisher>     m_publisher;
    std::shared_ptr<CTrafficLogger> m_trafficLogger;
    CChallengeDetector              m_challenges;
};
