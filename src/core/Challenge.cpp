#include "Challenge.hpp"

#include "../config/Config.hpp"
#include "../debug/log.hpp"
#include "../helpers/RequestUtils.hpp"

#include <charconv>
#include <map>

#include <glaze/glaze.hpp>

CChallengeDetector::CChallengeDetector(const CConfig& config) {
    const auto& CFG = config.m_config.challenge;

    setReply(config.m_parsedConfigDatas.challengeReply, CFG.json_key.empty() ? "challenge" : CFG.json_key);

    if (!CFG.enabled)
        return;

    if (!CFG.json_key.empty())
        addPredicate("json:" + CFG.json_key, NChallenge::jsonField(CFG.json_key, CFG.require_json_content_type));

    if (!CFG.header.empty())
        addPredicate("header:" + CFG.header, NChallenge::header(CFG.header));

    if (!CFG.query_param.empty())
        addPredicate("query:" + CFG.query_param, NChallenge::queryParam(CFG.query_param));
}

void CChallengeDetector::addPredicate(const std::string& name, challengePredicate pred) {
    m_predicates.emplace_back(SPredicate{name, std::move(pred)});
}

void CChallengeDetector::setReply(eChallengeReply reply, const std::string& jsonKey) {
    m_reply   = reply;
    m_jsonKey = jsonKey;
}

size_t CChallengeDetector::predicates() const {
    return m_predicates.size();
}

std::optional<SChallengeResponse> CChallengeDetector::detect(const SIncomingRequest& req) const {
    for (const auto& p : m_predicates) {
        const auto TOKEN = p.fn(req);
        if (!TOKEN)
            continue;

        Debug::log(TRACE, "Challenge matched by {}", p.name);
        return buildResponse(req, *TOKEN);
    }

    return std::nullopt;
}

SChallengeResponse CChallengeDetector::buildResponse(const SIncomingRequest& req, const std::string& token) const {
    SChallengeResponse response;

    switch (m_reply) {
        case CHALLENGE_REPLY_BODY: {
            if (req.body.empty()) {
                response.body = token;
                break;
            }

            response.body        = req.body;
            response.contentType = NRequestUtils::isJsonContentType(req.contentType) ? "application/json" : "text/plain";
            break;
        }

        case CHALLENGE_REPLY_TOKEN: {
            response.body = token;
            break;
        }

        case CHALLENGE_REPLY_JSON: {
            const std::map<std::string, std::string> REPLY{{m_jsonKey, token}};

            auto                                     json = glz::write_json(REPLY);
            response.body                                 = json.has_value() ? json.value() : token;
            response.contentType                          = json.has_value() ? "application/json" : "text/plain";
            break;
        }
    }

    return response;
}

challengePredicate NChallenge::jsonField(const std::string& key, bool requireJsonContentType) {
    return [key, requireJsonContentType](const SIncomingRequest& req) -> std::optional<std::string> {
        if (req.body.empty())
            return std::nullopt;

        if (requireJsonContentType && !NRequestUtils::isJsonContentType(req.contentType))
            return std::nullopt;

        // values stay raw so numbers keep their exact spelling
        auto json = glz::read_json<std::map<std::string, glz::raw_json>>(req.body);
        if (!json.has_value())
            return std::nullopt;

        const auto IT = json->find(key);
        if (IT == json->end())
            return std::nullopt;

        const auto VALUE = NRequestUtils::trim(IT->second.str);
        if (VALUE.empty())
            return std::nullopt;

        if (VALUE.front() == '"') {
            auto str = glz::read_json<std::string>(std::string{VALUE});
            if (!str.has_value() || str->empty())
                return std::nullopt;
            return *str;
        }

        if (VALUE == "true")
            return "true";

        // 0 and 0.0 are not a challenge
        double     number = 0;
        const auto RES    = std::from_chars(VALUE.data(), VALUE.data() + VALUE.size(), number);
        if (RES.ec == std::errc{} && RES.ptr == VALUE.data() + VALUE.size() && number != 0)
            return std::string{VALUE};

        return std::nullopt;
    };
}

challengePredicate NChallenge::header(const std::string& name) {
    return [name](const SIncomingRequest& req) -> std::optional<std::string> {
        const auto VALUE = req.headers.get(name);
        if (!VALUE || NRequestUtils::trim(*VALUE).empty())
            return std::nullopt;
        return std::string{NRequestUtils::trim(*VALUE)};
    };
}

challengePredicate NChallenge::queryParam(const std::string& name) {
    return [name](const SIncomingRequest& req) -> std::optional<std::string> {
        const auto IT = req.query.find(name);
        if (IT == req.query.end() || IT->second.empty())
            return std::nullopt;
        return IT->second;
    };
}
