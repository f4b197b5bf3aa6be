// crypto.cpp - content digest implementation
// Uses OpenSSL EVP for hashing

#include "crypto.hpp"
#include "logger.hpp"

#include <openssl/evp.h>
#include <openssl/err.h>

namespace promfile {
namespace crypto {

std::string sha256_hex(const std::string& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_Digest(data.data(), data.size(), hash, &hash_len, EVP_sha256(), nullptr) != 1) {
        char err_buf[256];
        ERR_error_string_n(ERR_get_error(), err_buf, sizeof(err_buf));
        Logger::error("[Crypto] SHA-256 digest failed: " + std::string(err_buf));
        return "";
    }

    static const char hex_digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(hash_len * 2);
    for (unsigned int i = 0; i < hash_len; ++i) {
        hex += hex_digits[hash[i] >> 4];
        hex += hex_digits[hash[i] & 0x0F];
    }
    return hex;
}

} // namespace crypto
} // namespace promfile
