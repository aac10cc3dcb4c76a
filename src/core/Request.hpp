#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <utility>

// header and query names compare case-insensitively
struct SCaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

class CHeaders {
  public:
    void                       add(const std::string& name, const std::string& value);

    bool                       has(const std::string& name) const;
    std::optional<std::string> get(const std::string& name) const;
    std::vector<std::string>   getAll(const std::string& name) const;
    size_t                     size() const;

  private:
    std::multimap<std::string, std::string, SCaseInsensitiveLess> m_headers;
};

// Transport-independent view of one inbound webhook call
struct SIncomingRequest {
    std::string                        method;
    std::string                        resource;
    std::map<std::string, std::string> query;
    CHeaders                           headers;
    std::string                        body;
    std::string                        contentType;
    std::string                        peer;
};

struct SHandlerResponse {
    int                                              code = 200;
    std::string                                      body;
    std::string                                      contentType = "text/plain";
    std::vector<std::pair<std::string, std::string>> headers;
};
