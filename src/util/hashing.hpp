#ifndef PHISCRUB_UTIL_HASHING_HPP
#define PHISCRUB_UTIL_HASHING_HPP

#include <cstddef>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <openssl/evp.h>
#include <openssl/sha.h>

/**
 * @file hashing.hpp
 * @brief SHA-256 digests used by the HASH action.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL (libcrypto).
 *
 * DESIGN:
 *   - Digests are unsalted and deterministic: identical input bytes always
 *     produce identical output. This is pseudonymization for linkage, not
 *     protection against dictionary attack.
 *
 * USAGE:
 *   @code
 *   using namespace phiscrub::util::hashing;
 *
 *   std::string full = sha256Hex("123-45-6789");        // 64 hex chars
 *   std::string tag  = sha256HexPrefix("123-45-6789", 16); // first 16
 *   @endcode
 */

namespace phiscrub {
namespace util {
namespace hashing {

/**
 * @brief Compute a SHA-256 hash of the input bytes, return as lowercase hex.
 * @throw std::runtime_error if OpenSSL fails.
 */
inline std::string sha256Hex(const std::string &input)
{
    EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
    if (mdctx == nullptr) {
        throw std::runtime_error("hashing::sha256Hex: Failed to create EVP_MD_CTX.");
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    unsigned int hashLen = 0;
    if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1
        || EVP_DigestUpdate(mdctx, input.data(), input.size()) != 1
        || EVP_DigestFinal_ex(mdctx, hash, &hashLen) != 1)
    {
        EVP_MD_CTX_free(mdctx);
        throw std::runtime_error("hashing::sha256Hex: SHA-256 computation failed.");
    }
    EVP_MD_CTX_free(mdctx);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < hashLen; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(hash[i]);
    }
    return oss.str();
}

/**
 * @brief First @p hexChars characters of sha256Hex(input).
 */
inline std::string sha256HexPrefix(const std::string &input, std::size_t hexChars)
{
    return sha256Hex(input).substr(0, hexChars);
}

} // namespace hashing
} // namespace util
} // namespace phiscrub

#endif // PHISCRUB_UTIL_HASHING_HPP
