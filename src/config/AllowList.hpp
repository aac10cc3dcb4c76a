#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "ConfigTypes.hpp"
#include "IPRange.hpp"

/*
    An ordered set of CIDR ranges a request origin has to fall into.
    Malformed entries are logged and skipped, never fatal.
    An empty list permits everything.
*/
class CAllowList {
  public:
    CAllowList() = default;
    CAllowList(const std::vector<std::string>& ranges, eAllInvalidPolicy policy = ALL_INVALID_ALLOW);

    bool   isAllowed(const std::string& ip) const;

    // true if any range restriction is in effect
    bool   configured() const;

    size_t validRanges() const;
    size_t invalidRanges() const;

  private:
    std::vector<CIPRange> m_ranges;
    size_t                m_invalid = 0;
    eAllInvalidPolicy     m_policy  = ALL_INVALID_ALLOW;
};

namespace NIPFilter {
    bool                     isAllowed(const std::string& ip, const std::vector<std::string>& ranges, eAllInvalidPolicy policy = ALL_INVALID_ALLOW);

    // splits a comma-separated range list, e.g. from IP_WHITELIST
    std::vector<std::string> splitRanges(std::string_view list);
};
