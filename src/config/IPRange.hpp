#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include <expected>

// A single IPv4 or IPv6 address, stored as 16-bit blocks (4 for v4, 8 for v6)
class CIP {
  public:
    CIP() = default;
    CIP(const std::string& ip);

    bool                  valid() const;

    bool                  m_v6 = false;
    std::vector<uint16_t> m_blocks;

  private:
    void parseV4(const std::string& ip);
    void parseV6(const std::string& ip);
};

// Accepts both ipv4 and ipv6.
// A bare address is treated as a /32 or /128.
class CIPRange {
  public:
    static std::expected<CIPRange, std::string> parse(std::string_view range);

    bool                                        ipMatches(const CIP& ip) const;
    size_t                                      subnet() const;

  private:
    CIPRange() = default;

    CIP    m_ip;
    size_t m_subnet = 0;

    bool   ipMatchesV6(const CIP& ip) const;
    bool   ipMatchesV4(const CIP& ip) const;
    bool   hostBitsSet() const;
};
