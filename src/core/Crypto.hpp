#pragma once

#include <string>

namespace NCrypto {
    // lowercase hex, empty on openssl failure
    std::string sha256(const std::string& in);
    std::string base64Encode(const std::string& in);
};
