#pragma once

/// @file fingerprint_utils.hpp
/// @brief SHA-256 hex digest using the OpenSSL 3.x EVP API.
///
/// Internal header for the bridge service.

#include <openssl/evp.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace rsb::service::detail {

/// Compute the SHA-256 digest of @p data as lowercase hex.
/// @return 64 hex characters, or an empty string on failure.
[[nodiscard]] inline std::string sha256Hex(std::string_view data) {
    auto* mdCtx = EVP_MD_CTX_new();
    if (!mdCtx) {
        return {};
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;

    bool ok = EVP_DigestInit_ex(mdCtx, EVP_sha256(), nullptr) == 1 &&
              EVP_DigestUpdate(mdCtx, data.data(), data.size()) == 1 &&
              EVP_DigestFinal_ex(mdCtx, digest, &digestLen) == 1;
    EVP_MD_CTX_free(mdCtx);
    if (!ok) {
        return {};
    }

    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(static_cast<std::size_t>(digestLen) * 2);
    for (unsigned int i = 0; i < digestLen; ++i) {
        out += kHex[(digest[i] >> 4) & 0x0F];
        out += kHex[digest[i] & 0x0F];
    }
    return out;
}

}  // namespace rsb::service::detail
