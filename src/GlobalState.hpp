#pragma once

#include <string>
#include <memory>

#define HOOKRELAY_VERSION "0.1.0"

struct SGlobalState {
    std::string cwd;
    std::string configPath;
};

inline std::unique_ptr<SGlobalState> g_pGlobalState = std::make_unique<SGlobalState>();
