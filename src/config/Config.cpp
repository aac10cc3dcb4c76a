#include "Config.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <optional>

#include <glaze/glaze.hpp>
#include <re2/re2.h>
#include <fmt/format.h>

#include "../helpers/FsUtils.hpp"
#include "../helpers/RequestUtils.hpp"
#include "../debug/log.hpp"

// https://cloud.google.com/pubsub/docs/pubsub-basics#resource_names
static const RE2 TOPIC_NAME_RE(R"([A-Za-z][A-Za-z0-9\-_.~+%]{2,254})");
// optionally domain-scoped, e.g. example.com:my-project
static const RE2 PROJECT_ID_RE(R"((?:[a-z0-9.\-]+:)?[a-z][a-z0-9\-]{4,28}[a-z0-9])");

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}

static eAllInvalidPolicy strToPolicy(const std::string& s, std::vector<std::string>& errors) {
    const auto LC = toLower(s);

    if (LC.empty() || LC == "allow")
        return ALL_INVALID_ALLOW;
    if (LC == "deny")
        return ALL_INVALID_DENY;

    errors.emplace_back(fmt::format("all_invalid_ranges must be \"allow\" or \"deny\", got \"{}\"", s));
    return ALL_INVALID_ALLOW;
}

static eChallengeReply strToReply(const std::string& s, std::vector<std::string>& errors) {
    const auto LC = toLower(s);

    if (LC.empty() || LC == "body")
        return CHALLENGE_REPLY_BODY;
    if (LC == "token")
        return CHALLENGE_REPLY_TOKEN;
    if (LC == "json")
        return CHALLENGE_REPLY_JSON;

    errors.emplace_back(fmt::format("challenge.reply must be one of body, token, json, got \"{}\"", s));
    return CHALLENGE_REPLY_BODY;
}

CConfig::CConfig(const SConfig& cfg) : m_config(cfg) {
    if (m_config.project_id.empty())
        m_errors.emplace_back("Missing required setting: project_id (GCP_PROJECT)");
    else if (!RE2::FullMatch(m_config.project_id, PROJECT_ID_RE))
        m_errors.emplace_back(fmt::format("Invalid project id \"{}\"", m_config.project_id));

    if (m_config.topic_name.empty())
        m_errors.emplace_back("Missing required setting: topic_name (TOPIC_NAME)");
    else if (!RE2::FullMatch(m_config.topic_name, TOPIC_NAME_RE) || m_config.topic_name.starts_with("goog"))
        m_errors.emplace_back(fmt::format("Invalid topic name \"{}\"", m_config.topic_name));

    if (!m_config.topic_project.empty() && !RE2::FullMatch(m_config.topic_project, PROJECT_ID_RE))
        m_errors.emplace_back(fmt::format("Invalid topic project \"{}\"", m_config.topic_project));

    if (m_config.publish_timeout_ms == 0)
        m_errors.emplace_back("publish_timeout_ms must be greater than 0");

    if (m_config.threads < 1)
        m_errors.emplace_back("threads must be at least 1");

    if (!listenPort())
        m_errors.emplace_back(fmt::format("Invalid port {}", m_config.port));

    if (!m_config.pubsub_endpoint.starts_with("https://") && !m_config.pubsub_endpoint.starts_with("http://"))
        m_errors.emplace_back(fmt::format("pubsub_endpoint must be an http:// or https:// url, got \"{}\"", m_config.pubsub_endpoint));

    // the metadata server only speaks plain http
    if (!m_config.metadata_endpoint.starts_with("http://"))
        m_errors.emplace_back(fmt::format("metadata_endpoint must be an http:// url, got \"{}\"", m_config.metadata_endpoint));

    if (m_config.challenge.enabled && m_config.challenge.json_key.empty() && m_config.challenge.header.empty() && m_config.challenge.query_param.empty())
        Debug::log(WARN, "Challenge detection is enabled but no json_key, header or query_param is set");

    m_parsedConfigDatas.allInvalidPolicy = strToPolicy(m_config.all_invalid_ranges, m_errors);
    m_parsedConfigDatas.challengeReply   = strToReply(m_config.challenge.reply, m_errors);
    m_parsedConfigDatas.allowList        = CAllowList(m_config.ip_allow_list, m_parsedConfigDatas.allInvalidPolicy);

    const auto& TOPIC_PROJECT      = m_config.topic_project.empty() ? m_config.project_id : m_config.topic_project;
    m_parsedConfigDatas.topicPath = fmt::format("projects/{}/topics/{}", TOPIC_PROJECT, m_config.topic_name);

    for (const auto& e : m_errors) {
        Debug::log(ERR, "Config: {}", e);
    }
}

bool CConfig::valid() const {
    return m_errors.empty();
}

std::optional<uint16_t> CConfig::listenPort() const {
    if (m_config.port <= 0 || m_config.port > 65535)
        return std::nullopt;

    return static_cast<uint16_t>(m_config.port);
}

const std::vector<std::string>& CConfig::errors() const {
    return m_errors;
}

std::expected<CConfig::SConfig, std::string> CConfig::readFile(const std::string& path) {
    const auto CONTENTS = NFsUtils::readFileAsString(path);
    if (!CONTENTS)
        return std::unexpected(fmt::format("Couldn't read {}: {}", path, CONTENTS.error()));

    auto json = glz::read_jsonc<SConfig>(*CONTENTS);

    if (!json.has_value())
        return std::unexpected(fmt::format("Bad config format: {}", glz::format_error(json.error(), *CONTENTS)));

    return json.value();
}

void CConfig::applyEnvironment(SConfig& cfg, const envGetter& getEnv) {
    auto env = [&getEnv](const char* name) -> std::optional<std::string> {
        const char* val = getEnv(name);
        if (!val)
            return std::nullopt;
        return std::string{val};
    };

    if (const auto V = env("GCP_PROJECT"))
        cfg.project_id = *V;

    if (const auto V = env("TOPIC_NAME"))
        cfg.topic_name = *V;

    if (const auto V = env("TOPIC_PROJECT"))
        cfg.topic_project = *V;

    if (const auto V = env("IP_WHITELIST"))
        cfg.ip_allow_list = NIPFilter::splitRanges(*V);

    if (const auto V = env("PORT")) {
        int        port = 0;
        const auto RES  = std::from_chars(V->data(), V->data() + V->size(), port);
        if (RES.ec == std::errc{} && RES.ptr == V->data() + V->size())
            cfg.port = port;
        else
            Debug::log(WARN, "Ignoring invalid PORT \"{}\"", *V);
    }

    if (const auto V = env("PUBSUB_EMULATOR_HOST"); V && !V->empty())
        cfg.pubsub_endpoint = V->starts_with("http://") ? *V : "http://" + *V;

    if (const auto V = env("PUBSUB_ACCESS_TOKEN"))
        cfg.access_token = *V;

    if (const auto V = env("GCE_METADATA_HOST"); V && !V->empty())
        cfg.metadata_endpoint = V->starts_with("http://") ? *V : "http://" + *V;
}
