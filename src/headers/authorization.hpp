#pragma once

#include <pistache/http_headers.h>
#include <pistache/net.h>

// Outbound only, carries the broker bearer token
class AuthorizationHeader : public Pistache::Http::Header::Header {
  public:
    NAME("Authorization");

    AuthorizationHeader() = default;

    void parse(const std::string& str) override {
        m_token = str;
    }

    void write(std::ostream& os) const override {
        os << m_token;
    }

  private:
    std::string m_token = "";
};
