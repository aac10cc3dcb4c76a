#include "TrafficLogger.hpp"

#include <chrono>
#include <sstream>
#include <fmt/format.h>

#include "../config/Config.hpp"
#include "../core/Crypto.hpp"
#include "../debug/log.hpp"
#include "../helpers/FsUtils.hpp"
#include "../helpers/RequestUtils.hpp"

CTrafficLogger::CTrafficLogger(const CConfig& config) {
    const auto& CFG = config.m_config.logging;

    if (!CFG.log_traffic)
        return;

    // parse the schema
    std::string_view schema = CFG.traffic_log_schema;
    while (!schema.empty()) {
        const auto COMMA = schema.find(',');
        const auto CURR  = NRequestUtils::trim(schema.substr(0, COMMA));

        if (CURR == "ip")
            m_logSchema.emplace_back(TRAFFIC_IP);
        else if (CURR == "epoch")
            m_logSchema.emplace_back(TRAFFIC_EPOCH);
        else if (CURR == "method")
            m_logSchema.emplace_back(TRAFFIC_METHOD);
        else if (CURR == "resource")
            m_logSchema.emplace_back(TRAFFIC_RESOURCE);
        else if (CURR == "action")
            m_logSchema.emplace_back(TRAFFIC_ACTION);
        else if (CURR == "size")
            m_logSchema.emplace_back(TRAFFIC_SIZE);
        else if (CURR == "digest")
            m_logSchema.emplace_back(TRAFFIC_DIGEST);
        else if (!CURR.empty())
            Debug::log(WARN, "TrafficLogger: unknown schema column \"{}\", ignoring", CURR);

        if (COMMA == std::string_view::npos)
            break;
        schema = schema.substr(COMMA + 1);
    }

    if (m_logSchema.empty()) {
        Debug::log(WARN, "TrafficLogger: empty schema, traffic logging disabled");
        return;
    }

    m_file.open(NFsUtils::absolutePath(CFG.traffic_log_file), std::ios::app);

    if (!m_file.good())
        Debug::die("TrafficLogger: bad file {}", CFG.traffic_log_file);

    m_enabled = true;
}

CTrafficLogger::~CTrafficLogger() {
    if (m_file.is_open())
        m_file.close();
}

static std::string sanitize(const std::string& s) {
    if (s.empty())
        return s;

    std::string cpy = s;
    size_t      pos = 0;
    while ((pos = cpy.find('"', pos)) != std::string::npos) {
        cpy.replace(pos, 1, "\\\"");
        pos += 2;
    }

    return cpy;
}

const char* actionToString(eRequestAction a) {
    switch (a) {
        case REQUEST_ACTION_PUBLISH: return "PUBLISH";
        case REQUEST_ACTION_CHALLENGE: return "CHALLENGE";
        case REQUEST_ACTION_DENY: return "DENY";
        case REQUEST_ACTION_BAD_METHOD: return "BAD_METHOD";
        case REQUEST_ACTION_CONFIG_ERROR: return "CONFIG_ERROR";
        case REQUEST_ACTION_PUBLISH_FAILED: return "PUBLISH_FAILED";
        case REQUEST_ACTION_INTERNAL_ERROR: return "INTERNAL_ERROR";
        case REQUEST_ACTION_NONE: return "NONE";
    }

    return "ERROR";
}

void CTrafficLogger::logTraffic(const SIncomingRequest& req, const std::string& ip, eRequestAction actionTaken) {
    if (!m_enabled)
        return;

    std::stringstream ss;

    for (const auto& t : m_logSchema) {
        switch (t) {
            case TRAFFIC_EPOCH: {
                ss << fmt::format("{},", std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count());
                break;
            }

            case TRAFFIC_IP: {
                ss << fmt::format("{},", ip.empty() ? "<unknown>" : sanitize(ip));
                break;
            }

            case TRAFFIC_METHOD: {
                ss << fmt::format("{},", sanitize(req.method));
                break;
            }

            case TRAFFIC_RESOURCE: {
                ss << fmt::format("\"{}\",", sanitize(req.resource));
                break;
            }

            case TRAFFIC_ACTION: {
                ss << fmt::format("{},", actionToString(actionTaken));
                break;
            }

            case TRAFFIC_SIZE: {
                ss << fmt::format("{},", req.body.size());
                break;
            }

            case TRAFFIC_DIGEST: {
                ss << fmt::format("{},", NCrypto::sha256(req.body));
                break;
            }
        }
    }

    std::string trafficLine = ss.str();
    if (trafficLine.empty())
        return;

    // replace , with \n
    trafficLine.back() = '\n';

    std::lock_guard<std::mutex> lg(m_fileMutex);
    m_file << trafficLine;
    m_file.flush();
}
