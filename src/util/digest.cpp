#include "util/digest.hpp"
#include "error/store_error.hpp"
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>

namespace tutor {
namespace util {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

namespace {

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw StoreError("Digest: Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  EVP_MD_CTX* get() { return ctx; }
};

const char BASE32_ALPHABET[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

} // namespace


//==============================================
// HASHING
//==============================================

std::vector<uint8_t> sha512(const std::string& data) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  DigestContext context;

  if (!EVP_DigestInit_ex(context.get(), EVP_sha512(), nullptr)) {
    throw StoreError("Digest: Failed to initialize hash context");
  }

  if (!EVP_DigestUpdate(context.get(), data.data(), data.size())) {
    throw StoreError("Digest: Failed to update hash");
  }

  if (!EVP_DigestFinal_ex(context.get(), hash, &hash_len)) {
    throw StoreError("Digest: Failed to finalize hash");
  }

  return std::vector<uint8_t>(hash, hash + hash_len);
}

std::string sha512_base32(const std::string& data) {
  std::string result = base32_encode(sha512(data));
  BOOST_LOG_TRIVIAL(trace) << "Digest: Hashed " << data.size() << " bytes to " << result;
  return result;
}


//==============================================
// ENCODING
//==============================================

std::string base32_encode(const std::vector<uint8_t>& bytes) {
  std::string out;
  out.reserve((bytes.size() + 4) / 5 * 8);

  // Feed bytes into a bit buffer and emit 5 bits at a time
  uint32_t buffer = 0;
  int bits = 0;
  for (uint8_t byte : bytes) {
    buffer = (buffer << 8) | byte;
    bits += 8;
    while (bits >= 5) {
      out.push_back(BASE32_ALPHABET[(buffer >> (bits - 5)) & 0x1F]);
      bits -= 5;
    }
  }
  if (bits > 0) {
    out.push_back(BASE32_ALPHABET[(buffer << (5 - bits)) & 0x1F]);
  }

  while (out.size() % 8 != 0) {
    out.push_back('=');
  }
  return out;
}

std::string strip_padding(const std::string& hash) {
  const auto first = hash.find_first_not_of('=');
  if (first == std::string::npos) {
    return "";
  }
  const auto last = hash.find_last_not_of('=');
  return hash.substr(first, last - first + 1);
}

} // namespace util
} // namespace tutor
