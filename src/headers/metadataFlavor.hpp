#pragma once

#include <pistache/http_headers.h>
#include <pistache/net.h>

// Required by the GCE / Cloud Run metadata server on every request
class MetadataFlavorHeader : public Pistache::Http::Header::Header {
  public:
    NAME("Metadata-Flavor");

    MetadataFlavorHeader() = default;

    void parse(const std::string& str) override {
        m_flavor = str;
    }

    void write(std::ostream& os) const override {
        os << m_flavor;
    }

  private:
    std::string m_flavor = "Google";
};
