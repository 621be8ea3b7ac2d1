#ifndef DOCSANITIZER_UTIL_IDENTIFIERS_HPP
#define DOCSANITIZER_UTIL_IDENTIFIERS_HPP

#include <array>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <openssl/rand.h>
#include <openssl/sha.h>

/**
 * @file identifiers.hpp
 * @brief Object identifiers and content fingerprints, both backed by OpenSSL.
 *
 * REQUIREMENTS:
 *   - Links against libcrypto.
 *
 * DESIGN:
 *   - newObjectId() returns a random (version 4) UUID in canonical lowercase
 *     8-4-4-4-12 form. RAND_bytes is a CSPRNG, so ids are not guessable by
 *     other uploaders.
 *   - sha256Hex() fingerprints payloads for log lines, so an upload can be
 *     correlated without ever logging its content.
 */

namespace docsanitizer {
namespace util {
namespace identifiers {

namespace detail {

inline std::string toHex(const unsigned char *data, size_t length)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(data[i]);
    }
    return oss.str();
}

} // namespace detail

/**
 * @brief Generate a random UUIDv4 string.
 * @throw std::runtime_error if OpenSSL cannot supply random bytes.
 */
inline std::string newObjectId()
{
    std::array<unsigned char, 16> raw{};
    if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
        throw std::runtime_error("identifiers::newObjectId: RAND_bytes failed.");
    }
    raw[6] = static_cast<unsigned char>((raw[6] & 0x0F) | 0x40); // version 4
    raw[8] = static_cast<unsigned char>((raw[8] & 0x3F) | 0x80); // RFC 4122 variant

    std::string hex = detail::toHex(raw.data(), raw.size());
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

/**
 * @brief True if the string has the canonical 8-4-4-4-12 hex layout.
 *        Used to reject obviously bogus ids before any lookup.
 */
inline bool isWellFormedObjectId(const std::string &id)
{
    if (id.size() != 36) {
        return false;
    }
    for (size_t i = 0; i < id.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (id[i] != '-') {
                return false;
            }
        } else if (!std::isxdigit(static_cast<unsigned char>(id[i]))) {
            return false;
        }
    }
    return true;
}

/**
 * @brief SHA-256 of a byte buffer as 64 lowercase hex characters.
 * @throw std::runtime_error if OpenSSL fails.
 */
inline std::string sha256Hex(const std::vector<uint8_t> &input)
{
    unsigned char hash[SHA256_DIGEST_LENGTH];
    if (!SHA256(input.data(), input.size(), hash)) {
        throw std::runtime_error("identifiers::sha256Hex: SHA256 computation failed.");
    }
    return detail::toHex(hash, SHA256_DIGEST_LENGTH);
}

/**
 * @brief Short fingerprint (first 12 hex chars of SHA-256) for log lines.
 */
inline std::string fingerprint(const std::vector<uint8_t> &input)
{
    return sha256Hex(input).substr(0, 12);
}

} // namespace identifiers
} // namespace util
} // namespace docsanitizer

#endif // DOCSANITIZER_UTIL_IDENTIFIERS_HPP
