#include <gtest/gtest.h>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>
#include "util/digest.hpp"

using namespace tutor::util;

namespace {

std::string to_hex(const std::vector<uint8_t>& bytes) {
  std::ostringstream ss;
  for (uint8_t byte : bytes) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

std::vector<uint8_t> bytes_of(const std::string& text) {
  return std::vector<uint8_t>(text.begin(), text.end());
}

} // namespace

TEST(DigestTest, Sha512KnownVector) {
  const auto digest = sha512("abc");
  ASSERT_EQ(digest.size(), 64u);
  EXPECT_EQ(to_hex(digest),
            "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
            "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f");
}

TEST(DigestTest, Base32Rfc4648Vectors) {
  EXPECT_EQ(base32_encode(bytes_of("")), "");
  EXPECT_EQ(base32_encode(bytes_of("f")), "MY======");
  EXPECT_EQ(base32_encode(bytes_of("fo")), "MZXQ====");
  EXPECT_EQ(base32_encode(bytes_of("foo")), "MZXW6===");
  EXPECT_EQ(base32_encode(bytes_of("foob")), "MZXW6YQ=");
  EXPECT_EQ(base32_encode(bytes_of("fooba")), "MZXW6YTB");
  EXPECT_EQ(base32_encode(bytes_of("foobar")), "MZXW6YTBOI======");
}

TEST(DigestTest, IdentityHashFormat) {
  EXPECT_EQ(sha512_base32("abc"),
            "3WXTLIMTMF5LVTCBONE24ICBGEJON6SORGUX5IQKT3XOMS2V2ONCDEUZFITU7QNIG25DYI5D73V32RKNIQRWIPHIBYVJVSKPUVGKJHY=");
  EXPECT_EQ(sha512_base32(""),
            "Z6B6CNL6564L34KUFBINM3MAA7LCBZAFBNLRLXED6SUSDU3M5HHEPUGRHROYL4VQ76BRRUUHP3WC6Y5ZGG6UOQL2QGSTQMT27ET5UPQ=");

  const std::string hash = sha512_base32("print(\"hello\")\n");
  EXPECT_EQ(hash.size(), IDENTITY_HASH_LENGTH);
  EXPECT_EQ(hash.back(), '=');
}

TEST(DigestTest, StripPadding) {
  EXPECT_EQ(strip_padding("MZXW6==="), "MZXW6");
  EXPECT_EQ(strip_padding("==AB=="), "AB");
  EXPECT_EQ(strip_padding("MZXW6YTB"), "MZXW6YTB");
  EXPECT_EQ(strip_padding("===="), "");
  EXPECT_EQ(strip_padding(""), "");

  const std::string stripped = strip_padding(sha512_base32("abc"));
  EXPECT_EQ(stripped.size(), IDENTITY_HASH_LENGTH - 1);
  EXPECT_EQ(stripped.find('='), std::string::npos);
}
