// crypto.hpp - content digests using OpenSSL
// Used to tag served content (ETag) and to spot reloads that changed nothing

#ifndef PROMFILE_CRYPTO_HPP
#define PROMFILE_CRYPTO_HPP

#include <cstddef>
#include <string>

namespace promfile {
namespace crypto {

// Lowercase hex SHA-256 of `data`; empty string if OpenSSL fails
std::string sha256_hex(const std::string& data);

constexpr size_t SHA256_HEX_SIZE = 64;

} // namespace crypto
} // namespace promfile

#endif // PROMFILE_CRYPTO_HPP
