#include "RequestUtils.hpp"

#include <algorithm>
#include <cctype>

std::string_view NRequestUtils::trim(std::string_view sv) {
    while (!sv.empty() && std::isspace((unsigned char)sv.front()))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace((unsigned char)sv.back()))
        sv.remove_suffix(1);
    return sv;
}

std::string NRequestUtils::ipForRequest(const CHeaders& headers, const std::string& peer, const std::string& forwardHeader) {
    if (!forwardHeader.empty()) {
        // proxies append, so the first value of the first header is the original client
        for (const auto& v : headers.getAll(forwardHeader)) {
            if (trim(v).empty())
                continue;

            const std::string_view VALUE = v;
            return std::string{trim(VALUE.substr(0, VALUE.find(',')))};
        }
    }

    return std::string{trim(peer)};
}

std::string NRequestUtils::ipForRequest(const SIncomingRequest& req, const std::string& forwardHeader) {
    return ipForRequest(req.headers, req.peer, forwardHeader);
}

bool NRequestUtils::isJsonContentType(const std::string& contentType) {
    std::string lc = std::string{trim(contentType.substr(0, contentType.find(';')))};
    std::transform(lc.begin(), lc.end(), lc.begin(), ::tolower);
    return lc == "application/json" || (lc.starts_with("application/") && lc.ends_with("+json"));
}
