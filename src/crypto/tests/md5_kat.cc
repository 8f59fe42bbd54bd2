#include <cstring>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "crypto/hash.h"
#include "crypto/hex.h"
#include "crypto/hex_with_quotes.h"
#include "crypto/md5.h"

namespace s3xfer {
namespace crypto {
namespace tests {

namespace {
struct KnownAnswer {
  const char *message;
  const char *hash;
};

constexpr KnownAnswer TESTS[] = {
    // RFC 1321, appendix A.5
    {"", "d41d8cd98f00b204e9800998ecf8427e"},
    {"a", "0cc175b9c0f1b6a831c399e269772661"},
    {"abc", "900150983cd24fb0d6963f7d28e17f72"},
    {"message digest", "f96b697d7cb7938d525a2f31aaf161d0"},
    {"abcdefghijklmnopqrstuvwxyz", "c3fcd3d76192e4007dfb496cca67e13b"},
    {"hello world!", "fc3ff98e8c6a0d3087d515c0473f8677"},
};
}  // namespace

TEST(Md5, KnownAnswers) {
  for (const auto &kat : TESTS) {
    const std::string hash =
        Hash::Compute<Md5, Hex>(kat.message, strlen(kat.message));
    EXPECT_EQ(std::string(kat.hash), hash) << "for kat = " << kat.message;
  }
}

TEST(Md5, QuotedHexOfVector) {
  const std::string in = "abc";
  const std::vector<char> data(in.begin(), in.end());

  EXPECT_EQ("\"900150983cd24fb0d6963f7d28e17f72\"",
            (Hash::Compute<Md5, HexWithQuotes>(data)));
}

TEST(Md5, IsValidQuotedHexHash) {
  EXPECT_TRUE(
      Md5::IsValidQuotedHexHash("\"900150983cd24fb0d6963f7d28e17f72\""));
  EXPECT_TRUE(
      Md5::IsValidQuotedHexHash("\"900150983CD24FB0D6963F7D28E17F72\""));

  EXPECT_FALSE(Md5::IsValidQuotedHexHash("900150983cd24fb0d6963f7d28e17f72"));
  EXPECT_FALSE(
      Md5::IsValidQuotedHexHash("\"900150983cd24fb0d6963f7d28e17f7\""));
  EXPECT_FALSE(
      Md5::IsValidQuotedHexHash("\"900150983cd24fb0d6963f7d28e17fzz\""));
  EXPECT_FALSE(
      Md5::IsValidQuotedHexHash("\"900150983cd24fb0d6963f7d28e17f72-3\""));
}

}  // namespace tests
}  // namespace crypto
}  // namespace s3xfer
