#include "IPRange.hpp"

#include <algorithm>
#include <charconv>

#include <arpa/inet.h>

#include "../helpers/RequestUtils.hpp"

CIP::CIP(const std::string& ip) {
    if (ip.contains(':'))
        parseV6(ip);
    else if (std::count(ip.begin(), ip.end(), '.') == 3)
        parseV4(ip);
}

bool CIP::valid() const {
    return m_blocks.size() == (m_v6 ? 8 : 4);
}

void CIP::parseV4(const std::string& ip) {
    m_v6 = false;

    uint8_t bytes[4];
    if (inet_pton(AF_INET, ip.c_str(), bytes) != 1)
        return;

    for (size_t i = 0; i < 4; ++i) {
        m_blocks.push_back(bytes[i]);
    }
}

void CIP::parseV6(const std::string& ip) {
    m_v6 = true;

    uint8_t bytes[16];
    if (inet_pton(AF_INET6, ip.c_str(), bytes) != 1)
        return;

    for (size_t i = 0; i < 8; ++i) {
        m_blocks.push_back((((uint16_t)bytes[i * 2]) << 8) | ((uint16_t)bytes[i * 2 + 1]));
    }
}

std::expected<CIPRange, std::string> CIPRange::parse(std::string_view rangeIn) {
    const auto RANGE = NRequestUtils::trim(rangeIn);

    if (RANGE.empty())
        return std::unexpected("empty range");

    CIPRange   range;
    const auto SLASH = RANGE.find('/');

    range.m_ip = CIP(std::string{RANGE.substr(0, SLASH)});

    if (!range.m_ip.valid())
        return std::unexpected("invalid address");

    const size_t MAX_SUBNET = range.m_ip.m_v6 ? 128 : 32;

    if (SLASH == std::string_view::npos)
        range.m_subnet = MAX_SUBNET;
    else {
        const auto SUBNET = RANGE.substr(SLASH + 1);
        const auto RES    = std::from_chars(SUBNET.data(), SUBNET.data() + SUBNET.size(), range.m_subnet);
        if (SUBNET.empty() || RES.ec != std::errc{} || RES.ptr != SUBNET.data() + SUBNET.size())
            return std::unexpected("invalid prefix length");

        if (range.m_subnet > MAX_SUBNET)
            return std::unexpected("prefix length out of range");
    }

    if (range.hostBitsSet())
        return std::unexpected("has host bits set");

    return range;
}

size_t CIPRange::subnet() const {
    return m_subnet;
}

bool CIPRange::hostBitsSet() const {
    const size_t BLOCK_BITS = m_ip.m_v6 ? 16 : 8;

    for (size_t i = 0; i < m_ip.m_blocks.size(); ++i) {
        const size_t FIRST_BIT = i * BLOCK_BITS;
        if (m_subnet >= FIRST_BIT + BLOCK_BITS)
            continue;

        const size_t   KEPT      = m_subnet > FIRST_BIT ? m_subnet - FIRST_BIT : 0;
        const uint16_t HOST_MASK = (uint16_t)((1U << (BLOCK_BITS - KEPT)) - 1);
        if (m_ip.m_blocks[i] & HOST_MASK)
            return true;
    }

    return false;
}

bool CIPRange::ipMatches(const CIP& ip) const {
    if (!ip.valid())
        return false;

    if (m_ip.m_v6 != ip.m_v6)
        return false;

    if (m_ip.m_v6)
        return ipMatchesV6(ip);
    return ipMatchesV4(ip);
}

bool CIPRange::ipMatchesV4(const CIP& ip) const {
    uint32_t rangeMask = m_subnet == 0 ? 0 : 0xFFFFFFFF << (32 - m_subnet);
    uint32_t rangeIP =
        (((uint32_t)m_ip.m_blocks.at(0)) << 24) | (((uint32_t)m_ip.m_blocks.at(1)) << 16) | (((uint32_t)m_ip.m_blocks.at(2)) << 8) | (((uint32_t)m_ip.m_blocks.at(3)) << 0);
    uint32_t incomingIP =
        (((uint32_t)ip.m_blocks.at(0)) << 24) | (((uint32_t)ip.m_blocks.at(1)) << 16) | (((uint32_t)ip.m_blocks.at(2)) << 8) | (((uint32_t)ip.m_blocks.at(3)) << 0);

    return (rangeMask & rangeIP) == (rangeMask & incomingIP);
}

bool CIPRange::ipMatchesV6(const CIP& ip) const {
    uint64_t rangeMaskLeft = m_subnet == 0 ? 0 : 0xFFFFFFFFFFFFFFFF << (m_subnet > 64 ? 0 : 64 - m_subnet);
    uint64_t rangeIPLeft =
        (((uint64_t)m_ip.m_blocks.at(0)) << 48) | (((uint64_t)m_ip.m_blocks.at(1)) << 32) | (((uint64_t)m_ip.m_blocks.at(2)) << 16) | (((uint64_t)m_ip.m_blocks.at(3)) << 0);
    uint64_t incomingIPLeft =
        (((uint64_t)ip.m_blocks.at(0)) << 48) | (((uint64_t)ip.m_blocks.at(1)) << 32) | (((uint64_t)ip.m_blocks.at(2)) << 16) | (((uint64_t)ip.m_blocks.at(3)) << 0);

    if ((rangeMaskLeft & rangeIPLeft) != (rangeMaskLeft & incomingIPLeft))
        return false;

    if (m_subnet <= 64)
        return true;

    uint64_t rangeMaskRight = 0xFFFFFFFFFFFFFFFF << (/* m_subnet > 64 */ 128 - m_subnet);
    uint64_t rangeIPRight =
        (((uint64_t)m_ip.m_blocks.at(4)) << 48) | (((uint64_t)m_ip.m_blocks.at(5)) << 32) | (((uint64_t)m_ip.m_blocks.at(6)) << 16) | (((uint64_t)m_ip.m_blocks.at(7)) << 0);
    uint64_t incomingIPRight =
        (((uint64_t)ip.m_blocks.at(4)) << 48) | (((uint64_t)ip.m_blocks.at(5)) << 32) | (((uint64_t)ip.m_blocks.at(6)) << 16) | (((uint64_t)ip.m_blocks.at(7)) << 0);

    return (rangeMaskRight & rangeIPRight) == (rangeMaskRight & incomingIPRight);
}
