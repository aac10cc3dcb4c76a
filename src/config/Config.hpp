#pragma once

#include <string>
#include <memory>
#include <vector>
#include <expected>
#include <functional>
#include <cstdlib>
#include <cstdint>
#include <optional>

#include "ConfigTypes.hpp"
#include "AllowList.hpp"

class CConfig {
  public:
    struct SConfig {
        int                      port               = 8080;
        int                      threads            = 2;
        unsigned long int        max_request_size   = 10000000; // 10MB
        std::string              project_id         = "";
        std::string              topic_name         = "";
        std::string              topic_project      = "";
        std::vector<std::string> ip_allow_list      = {};
        std::string              all_invalid_ranges = "allow";
        std::string              client_ip_header   = "X-Forwarded-For";
        unsigned long int        publish_timeout_ms = 5000;
        std::string              pubsub_endpoint    = "https://pubsub.googleapis.com";
        // empty: tokens come from the metadata server for https endpoints, none for http
        std::string              access_token       = "";
        std::string              metadata_endpoint  = "http://metadata.google.internal";
        bool                     trace_logging      = false;

        struct {
            bool        enabled                   = true;
            std::string json_key                  = "challenge";
            std::string header                    = "";
            std::string query_param               = "";
            std::string reply                     = "body";
            bool        require_json_content_type = true;
        } challenge;

        struct {
            bool        log_traffic = false;
            std::string traffic_log_schema;
            std::string traffic_log_file;
        } logging;
    };

    using envGetter = std::function<const char*(const char*)>;

    // validates cfg once, errors put the config into degraded mode
    CConfig(const SConfig& cfg);

    static std::expected<SConfig, std::string> readFile(const std::string& path);
    static void                                applyEnvironment(SConfig& cfg, const envGetter& getEnv = [](const char* name) { return std::getenv(name); });

    bool                                       valid() const;
    // nullopt when port is outside 1-65535, nothing sensible can listen then
    std::optional<uint16_t>                    listenPort() const;
    const std::vector<std::string>&            errors() const;

    SConfig                                    m_config;

    struct {
        CAllowList        allowList;
        eAllInvalidPolicy allInvalidPolicy = ALL_INVALID_ALLOW;
        eChallengeReply   challengeReply   = CHALLENGE_REPLY_BODY;
        std::string       topicPath;
    } m_parsedConfigDatas;

  private:
    std::vector<std::string> m_errors;
};

inline std::shared_ptr<CConfig> g_pConfig;
