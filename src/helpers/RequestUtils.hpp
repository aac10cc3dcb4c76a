#pragma once

#include <string>
#include <string_view>

#include "../core/Request.hpp"

namespace NRequestUtils {
    std::string_view trim(std::string_view sv);

    // left-most hop of the forwarding header, or the socket peer if there is none.
    // An empty result means the origin could not be determined.
    std::string ipForRequest(const CHeaders& headers, const std::string& peer, const std::string& forwardHeader = "X-Forwarded-For");
    std::string ipForRequest(const SIncomingRequest& req, const std::string& forwardHeader = "X-Forwarded-For");

    bool        isJsonContentType(const std::string& contentType);
};
