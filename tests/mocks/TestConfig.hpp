#pragma once

#include "config/Config.hpp"

#include <memory>

// the smallest configuration that passes validation
inline CConfig::SConfig validConfig() {
    CConfig::SConfig cfg;
    cfg.project_id = "test-project";
    cfg.topic_name = "webhook-events";
    return cfg;
}

inline std::shared_ptr<const CConfig> makeConfig(const CConfig::SConfig& cfg) {
    return std::make_shared<const CConfig>(cfg);
}
