#pragma once

#include <string>
#include <cstdint>
#include <memory>
#include <fstream>
#include <mutex>
#include <vector>

#include "../config/ConfigTypes.hpp"
#include "../core/Request.hpp"

class CConfig;

// Optional CSV log with one line per handled request. Never contains payload bytes.
class CTrafficLogger {
  public:
    CTrafficLogger(const CConfig& config);
    ~CTrafficLogger();

    void logTraffic(const SIncomingRequest& req, const std::string& ip, eRequestAction actionTaken);

  private:
    enum eTrafficLoggerProps : uint8_t {
        TRAFFIC_EPOCH = 0,
        TRAFFIC_IP,
        TRAFFIC_METHOD,
        TRAFFIC_RESOURCE,
        TRAFFIC_ACTION,
        TRAFFIC_SIZE,
        TRAFFIC_DIGEST,
    };

    bool                             m_enabled = false;
    std::vector<eTrafficLoggerProps> m_logSchema;
    std::ofstream                    m_file;
    std::mutex                       m_fileMutex;
};

const char* actionToString(eRequestAction a);
