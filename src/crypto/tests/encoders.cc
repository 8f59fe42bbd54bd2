#include <cstring>
#include <string>

#include <gtest/gtest.h>

#include "crypto/base64.h"
#include "crypto/encoder.h"
#include "crypto/hex.h"
#include "crypto/hex_with_quotes.h"

namespace s3xfer {
namespace crypto {
namespace tests {

namespace {
struct KnownAnswer {
  const char *plain;
  const char *hex;
  const char *hex_quote;
  const char *base64;
};

constexpr KnownAnswer KAT_TESTS[] = {
    {"", "", "\"\"", ""},
    {"hello world!", "68656c6c6f20776f726c6421",
     "\"68656c6c6f20776f726c6421\"", "aGVsbG8gd29ybGQh"},
    {"11" /* should pad */, "3131", "\"3131\"", "MTE="},
    {"1234" /* should pad twice */, "31323334", "\"31323334\"", "MTIzNA=="}};

template <class Encoding>
void EncodeKat(const char *KnownAnswer::*output) {
  for (const auto &kat : KAT_TESTS)
    EXPECT_EQ(kat.*output, Encoder::Encode<Encoding>(kat.plain,
                                                     strlen(kat.plain)))
        << "for plain = " << kat.plain;
}
}  // namespace

TEST(Encoders, Hex) { EncodeKat<Hex>(&KnownAnswer::hex); }

TEST(Encoders, HexWithQuotes) {
  EncodeKat<HexWithQuotes>(&KnownAnswer::hex_quote);
}

TEST(Encoders, Base64) { EncodeKat<Base64>(&KnownAnswer::base64); }

TEST(Encoders, HexOfHighBytes) {
  const uint8_t in[] = {0x00, 0x7f, 0x80, 0xff};
  EXPECT_EQ("007f80ff", Encoder::Encode<Hex>(in, sizeof(in)));
}

}  // namespace tests
}  // namespace crypto
}  // namespace s3xfer
