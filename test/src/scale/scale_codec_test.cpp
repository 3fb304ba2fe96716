#include <gtest/gtest.h>

#include "scale/scale.hpp"
#include "testutil/outcome.hpp"

using csync::scale::ByteArray;
using csync::scale::DecodeError;
using csync::scale::ScaleDecoderStream;
using csync::scale::ScaleEncoderStream;

/**
 * @given raw string
 * @when specified string is encoded by ScaleEncoderStream
 * @then encoded value meets expectations
 */
TEST(Scale, StdStringEncodeSuccess) {
  std::string v = "asdadad";
  ScaleEncoderStream s;
  ASSERT_NO_THROW((s << v));
  ASSERT_EQ(s.data(), (ByteArray{28, 'a', 's', 'd', 'a', 'd', 'a', 'd'}));
}

/**
 * @given byte array containing encoded string
 * @when string is decoded using ScaleDecoderStream
 * @then decoded string matches expectations
 */
TEST(Scale, StringDecodeSuccess) {
  auto bytes = ByteArray{28, 'a', 's', 'd', 'a', 'd', 'a', 'd'};
  ScaleDecoderStream s(bytes);
  std::string v;
  ASSERT_NO_THROW(s >> v);
  ASSERT_EQ(v, "asdadad");
}

/**
 * @given compact lengths on each side of the single and two byte modes
 * @when encoded
 * @then the mode flag occupies the two lowest bits
 */
TEST(Scale, CompactModes) {
  ScaleEncoderStream small;
  small.encodeCompact(63);
  ASSERT_EQ(small.data(), (ByteArray{252}));

  ScaleEncoderStream two_bytes;
  two_bytes.encodeCompact(64);
  ASSERT_EQ(two_bytes.data(), (ByteArray{1, 1}));

  auto encoded = two_bytes.data();
  ScaleDecoderStream s(encoded);
  ASSERT_EQ(s.decodeCompact(), 64);
}

/**
 * @given fixed width integers and booleans
 * @when encoded together
 * @then integers are little endian and booleans one byte
 */
TEST(Scale, IntegersAndBool) {
  EXPECT_OUTCOME_TRUE(bytes, csync::scale::encode(uint16_t{0x0102}, true));
  ASSERT_EQ(bytes, (ByteArray{2, 1, 1}));
}

/**
 * @given present and absent optional values
 * @when encoded and decoded
 * @then the flag byte tells them apart
 */
TEST(Scale, Optional) {
  EXPECT_OUTCOME_TRUE(none, csync::scale::encode(boost::optional<uint8_t>{}));
  ASSERT_EQ(none, (ByteArray{0}));
  EXPECT_OUTCOME_TRUE(some,
                      csync::scale::encode(boost::optional<uint8_t>{7}));
  ASSERT_EQ(some, (ByteArray{1, 7}));

  EXPECT_OUTCOME_TRUE(decoded,
                      csync::scale::decode<boost::optional<uint8_t>>(some));
  ASSERT_EQ(decoded, boost::optional<uint8_t>{7});
}

/**
 * @given malformed inputs
 * @when decoded
 * @then short input, bad booleans and leftovers are reported
 */
TEST(Scale, DecodeErrors) {
  EXPECT_OUTCOME_ERROR(short_input,
                       csync::scale::decode<uint32_t>(ByteArray{1, 2}),
                       DecodeError::NOT_ENOUGH_DATA);
  EXPECT_OUTCOME_ERROR(bad_bool,
                       csync::scale::decode<bool>(ByteArray{2}),
                       DecodeError::UNEXPECTED_VALUE);
  EXPECT_OUTCOME_ERROR(trailing,
                       csync::scale::decode<uint8_t>(ByteArray{1, 2}),
                       DecodeError::TRAILING_DATA);
}
