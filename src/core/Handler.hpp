#pragma once

#include <pistache/http.h>
#include <memory>

#include "Request.hpp"
#include "WebhookHandler.hpp"

// Bridges Pistache requests to the transport-independent CWebhookHandler
class CServerHandler : public Pistache::Http::Handler {

    HTTP_PROTOTYPE(CServerHandler)

  public:
    CServerHandler(std::shared_ptr<const CWebhookHandler> handler);

    void                    onRequest(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter response) override;

    void                    onTimeout(const Pistache::Http::Request& request, Pistache::Http::ResponseWriter response) override;

    static SIncomingRequest incomingFor(const Pistache::Http::Request& req);

  private:
    std::shared_ptr<const CWebhookHandler> m_handler;
};
