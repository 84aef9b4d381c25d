#ifndef TUTOR_UTIL_DIGEST_HPP
#define TUTOR_UTIL_DIGEST_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace tutor {
namespace util {

// Length of a base32-encoded SHA-512 digest, padding included
constexpr std::size_t IDENTITY_HASH_LENGTH = 104;

// Raw SHA-512 digest of data, computed with OpenSSL EVP
std::vector<uint8_t> sha512(const std::string& data);

// RFC 4648 base32 (uppercase alphabet, '=' padding to a multiple of 8)
std::string base32_encode(const std::vector<uint8_t>& bytes);

// base32(sha512(data)): the token format used for identity and answer hashes
std::string sha512_base32(const std::string& data);

// Hash with '=' characters removed from both ends
std::string strip_padding(const std::string& hash);

} // namespace util
} // namespace tutor

#endif // TUTOR_UTIL_DIGEST_HPP
