/**
 * @file Uuid.cpp
 * @brief Random identifier generation for sessions, samples, geofences and events
 *
 * Identifiers are RFC 4122 version 4 UUIDs drawn from the OpenSSL CSPRNG so
 * they are safe to expose to clients and cannot be guessed from one another.
 */

#include "Uuid.hpp"
#include <openssl/err.h>
#include <openssl/rand.h>
#include <array>
#include <cctype>
#include <stdexcept>

namespace geotrack {

/**
 * @brief Generate a version 4 UUID
 * @return Lowercase canonical UUID string
 * @throws std::runtime_error if the OpenSSL CSPRNG cannot supply entropy
 */
std::string Uuid::generateV4() {
    std::array<unsigned char, 16> bytes{};

    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        unsigned long err = ERR_get_error();
        char reason[256] = {0};
        ERR_error_string_n(err, reason, sizeof(reason));
        throw std::runtime_error(std::string("RAND_bytes failed: ") + reason);
    }

    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(36);

    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(hex[bytes[i] >> 4]);
        out.push_back(hex[bytes[i] & 0x0F]);
    }

    return out;
}

bool Uuid::isCanonical(const std::string& value) {
    if (value.size() != 36) return false;

    for (size_t i = 0; i < value.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (value[i] != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(value[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace geotrack
