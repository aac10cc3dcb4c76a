#include "Handler.hpp"
#include "../headers/xforwardfor.hpp"
#include "../debug/log.hpp"

#include <sstream>

CServerHandler::CServerHandler(std::shared_ptr<const CWebhookHandler> handler) : m_handler(handler) {
    ;
}

SIncomingRequest CServerHandler::incomingFor(const Pistache::Http::Request& req) {
    SIncomingRequest incoming;

    incoming.method   = Pistache::Http::methodString(req.method());
    incoming.resource = req.resource();
    incoming.body     = req.body();
    incoming.peer     = req.address().host();

    for (auto it = req.query().parameters_begin(); it != req.query().parameters_end(); ++it) {
        incoming.query.emplace(it->first, it->second);
    }

    // registered headers are parsed into typed objects, the rest stay raw
    for (const auto& h : req.headers().list()) {
        std::stringstream ss;
        h->write(ss);
        incoming.headers.add(h->name(), ss.str());
    }

    for (const auto& [name, raw] : req.headers().rawList()) {
        incoming.headers.add(raw.name(), raw.value());
    }

    incoming.contentType = incoming.headers.get("Content-Type").value_or("");

    return incoming;
}

void CServerHandler::onRequest(const Pistache::Http::Request& req, Pistache::Http::ResponseWriter response) {
    SIncomingRequest incoming;

    try {
        incoming = incomingFor(req);
    } catch (std::exception& e) {
        Debug::log(ERR, "Couldn't read request: {}", e.what());
        response.send(Pistache::Http::Code::Bad_Request, "Bad Request");
        return;
    }

    if (const auto XFF = req.headers().tryGet<XForwardedForHeader>(); XFF)
        Debug::log(TRACE, "Request was forwarded through {} hop(s)", XFF->hops().size());

    const auto RESPONSE = m_handler->handle(incoming);

    for (const auto& [name, value] : RESPONSE.headers) {
        response.headers().addRaw(Pistache::Http::Header::Raw(name, value));
    }

    response.setMime(Pistache::Http::Mime::MediaType::fromString(RESPONSE.contentType));
    response.send(static_cast<Pistache::Http::Code>(RESPONSE.code), RESPONSE.body).then([](ssize_t) {}, PrintException());
}

void CServerHandler::onTimeout(const Pistache::Http::Request& request, Pistache::Http::ResponseWriter response) {
    response.send(Pistache::Http::Code::Request_Timeout, "Timeout").then([=](ssize_t) {}, PrintException());
}
