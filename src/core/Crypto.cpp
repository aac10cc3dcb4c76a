#include "Crypto.hpp"

#include "../debug/log.hpp"

#include <sstream>
#include <vector>

#include <openssl/evp.h>
#include <openssl/err.h>
#include <fmt/format.h>

std::string NCrypto::sha256(const std::string& in) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx)
        return "";

    if (!EVP_DigestInit(ctx, EVP_sha256())) {
        EVP_MD_CTX_free(ctx);
        return "";
    }

    if (!EVP_DigestUpdate(ctx, in.c_str(), in.size())) {
        EVP_MD_CTX_free(ctx);
        return "";
    }

    uint8_t buf[32];

    if (!EVP_DigestFinal(ctx, buf, nullptr)) {
        Debug::log(ERR, "NCrypto::sha256: EVP_DigestFinal: err {}", ERR_error_string(ERR_get_error(), nullptr));
        EVP_MD_CTX_free(ctx);
        return "";
    }

    std::stringstream ss;
    for (size_t i = 0; i < 32; ++i) {
        ss << fmt::format("{:02x}", buf[i]);
    }

    EVP_MD_CTX_free(ctx);

    return ss.str();
}

std::string NCrypto::base64Encode(const std::string& in) {
    if (in.empty())
        return "";

    // 4 output bytes per 3 input bytes, plus the null terminator
    std::vector<unsigned char> buf;
    buf.resize(4 * ((in.size() + 2) / 3) + 1);

    const int LEN = EVP_EncodeBlock(buf.data(), (const unsigned char*)in.data(), (int)in.size());
    if (LEN < 0)
        return "";

    return std::string{(const char*)buf.data(), (size_t)LEN};
}
