#include "AllowList.hpp"

#include "../debug/log.hpp"
#include "../helpers/RequestUtils.hpp"

CAllowList::CAllowList(const std::vector<std::string>& ranges, eAllInvalidPolicy policy) : m_policy(policy) {
    for (const auto& r : ranges) {
        if (NRequestUtils::trim(r).empty())
            continue;

        auto range = CIPRange::parse(r);
        if (!range) {
            Debug::log(WARN, "Invalid IP range \"{}\" in allow list: {}, skipping", r, range.error());
            m_invalid++;
            continue;
        }

        m_ranges.emplace_back(std::move(*range));
    }

    if (m_ranges.empty() && m_invalid > 0)
        Debug::log(ERR, "Allow list has {} entries but none are valid, {} all traffic", m_invalid, m_policy == ALL_INVALID_DENY ? "denying" : "allowing");
}

bool CAllowList::configured() const {
    return !m_ranges.empty() || (m_invalid > 0 && m_policy == ALL_INVALID_DENY);
}

size_t CAllowList::validRanges() const {
    return m_ranges.size();
}

size_t CAllowList::invalidRanges() const {
    return m_invalid;
}

bool CAllowList::isAllowed(const std::string& ip) const {
    if (m_ranges.empty())
        return m_invalid == 0 || m_policy == ALL_INVALID_ALLOW;

    const auto IP = CIP(std::string{NRequestUtils::trim(ip)});
    if (!IP.valid()) {
        Debug::log(TRACE, "Allow list: \"{}\" is not a valid ip", ip);
        return false;
    }

    for (const auto& r : m_ranges) {
        if (r.ipMatches(IP))
            return true;
    }

    return false;
}

bool NIPFilter::isAllowed(const std::string& ip, const std::vector<std::string>& ranges, eAllInvalidPolicy policy) {
    return CAllowList(ranges, policy).isAllowed(ip);
}

std::vector<std::string> NIPFilter::splitRanges(std::string_view list) {
    std::vector<std::string> ranges;

    size_t                   lastPos = 0;
    while (lastPos <= list.size()) {
        size_t next = list.find(',', lastPos);
        if (next == std::string_view::npos)
            next = list.size();

        const auto CURR = NRequestUtils::trim(list.substr(lastPos, next - lastPos));
        if (!CURR.empty())
            ranges.emplace_back(CURR);

        lastPos = next + 1;
    }

    return ranges;
}
