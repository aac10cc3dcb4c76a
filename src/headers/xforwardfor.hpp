#pragma once

#include <pistache/http_headers.h>
#include <pistache/net.h>

#include <string>
#include <vector>

#include "../helpers/RequestUtils.hpp"

class XForwardedForHeader : public Pistache::Http::Header::Header {
  public:
    NAME("X-Forwarded-For");

    XForwardedForHeader() = default;

    void parse(const std::string& str) override {
        m_for = str;
    }

    void write(std::ostream& os) const override {
        os << m_for;
    }

    // every proxy appends one hop, the client comes first
    std::vector<std::string> hops() const {
        std::vector<std::string> result;
        std::string_view         sv = m_for;
        while (!sv.empty()) {
            const auto COMMA = sv.find(',');
            result.emplace_back(NRequestUtils::trim(sv.substr(0, COMMA)));
            if (COMMA == std::string_view::npos)
                break;
            sv = sv.substr(COMMA + 1);
        }
        return result;
    }

  private:
    std::string m_for = "";
};
