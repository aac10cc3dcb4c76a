#include "Request.hpp"

#include <algorithm>
#include <cctype>

bool SCaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
                                        [](unsigned char l, unsigned char r) { return std::tolower(l) < std::tolower(r); });
}

void CHeaders::add(const std::string& name, const std::string& value) {
    m_headers.emplace(name, value);
}

bool CHeaders::has(const std::string& name) const {
    return m_headers.contains(name);
}

std::optional<std::string> CHeaders::get(const std::string& name) const {
    const auto IT = m_headers.find(name);
    if (IT == m_headers.end())
        return std::nullopt;
    return IT->second;
}

std::vector<std::string> CHeaders::getAll(const std::string& name) const {
    std::vector<std::string> values;
    const auto [begin, end] = m_headers.equal_range(name);
    for (auto it = begin; it != end; ++it) {
        values.emplace_back(it->second);
    }
    return values;
}

size_t CHeaders::size() const {
    return m_headers.size();
}
