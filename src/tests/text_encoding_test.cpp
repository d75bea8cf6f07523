#include <gtest/gtest.h>
#include <initializer_list>
#include <string>
#include "codec/base64.hpp"
#include "codec/text_encoding.hpp"

using namespace pdfmeta::codec;

namespace {

std::string bytes(std::initializer_list<int> values) {
  std::string result;
  for (int value : values) {
    result.push_back(static_cast<char>(value));
  }
  return result;
}

const std::string REPLACEMENT(REPLACEMENT_CHARACTER);

} // namespace

TEST(TextEncodingTest, Utf8LossyKeepsValidText) {
  const std::string text = "Caf" + bytes({0xC3, 0xA9}) + " " + bytes({0xF0, 0x9F, 0x98, 0x80});
  EXPECT_EQ(utf8_lossy(text), text);
  EXPECT_EQ(utf8_lossy(""), "");
}

TEST(TextEncodingTest, Utf8LossyReplacesInvalidBytes) {
  EXPECT_EQ(utf8_lossy("abc" + bytes({0xFF}) + "def"), "abc" + REPLACEMENT + "def");

  // Overlong encoding: each byte is its own invalid subpart
  EXPECT_EQ(utf8_lossy(bytes({0xC0, 0xAF})), REPLACEMENT + REPLACEMENT);

  // Truncated sequence is replaced once
  EXPECT_EQ(utf8_lossy(bytes({0xE2, 0x82})), REPLACEMENT);
  EXPECT_EQ(utf8_lossy(bytes({0xE2, 0x82}) + "x"), REPLACEMENT + "x");

  // Encoded surrogate
  EXPECT_EQ(utf8_lossy(bytes({0xED, 0xA0, 0x80})), REPLACEMENT + REPLACEMENT + REPLACEMENT);
}

TEST(TextEncodingTest, HasNonAscii) {
  EXPECT_FALSE(has_non_ascii(""));
  EXPECT_FALSE(has_non_ascii("Plain ASCII ~!@#"));
  EXPECT_TRUE(has_non_ascii("Ol" + bytes({0xC3, 0xA1})));
}

TEST(TextEncodingTest, Utf16DecodesBothByteOrders) {
  EXPECT_EQ(utf16_to_utf8(bytes({0x00, 0x41, 0x00, 0xE9}), Utf16Order::BigEndian),
            "A" + bytes({0xC3, 0xA9}));
  EXPECT_EQ(utf16_to_utf8(bytes({0x41, 0x00, 0xE9, 0x00}), Utf16Order::LittleEndian),
            "A" + bytes({0xC3, 0xA9}));
  EXPECT_EQ(utf16_to_utf8("", Utf16Order::BigEndian), "");
}

TEST(TextEncodingTest, Utf16DecodesSurrogatePairs) {
  const std::string grinning_face = bytes({0xF0, 0x9F, 0x98, 0x80});
  EXPECT_EQ(utf16_to_utf8(bytes({0xD8, 0x3D, 0xDE, 0x00}), Utf16Order::BigEndian), grinning_face);
  EXPECT_EQ(utf16_to_utf8(bytes({0x3D, 0xD8, 0x00, 0xDE}), Utf16Order::LittleEndian), grinning_face);
}

TEST(TextEncodingTest, Utf16RejectsMalformedInput) {
  // Odd length
  EXPECT_FALSE(utf16_to_utf8(bytes({0x00, 0x41, 0x00}), Utf16Order::BigEndian).has_value());
  // High surrogate followed by a regular unit
  EXPECT_FALSE(utf16_to_utf8(bytes({0xD8, 0x3D, 0x00, 0x41}), Utf16Order::BigEndian).has_value());
  // High surrogate at the end
  EXPECT_FALSE(utf16_to_utf8(bytes({0x00, 0x41, 0xD8, 0x3D}), Utf16Order::BigEndian).has_value());
  // Lone low surrogate
  EXPECT_FALSE(utf16_to_utf8(bytes({0xDC, 0x00}), Utf16Order::BigEndian).has_value());
}

TEST(TextEncodingTest, Utf8ToUtf16BigEndian) {
  EXPECT_EQ(utf8_to_utf16be("A" + bytes({0xC3, 0xA9})), bytes({0x00, 0x41, 0x00, 0xE9}));
  EXPECT_EQ(utf8_to_utf16be(bytes({0xE2, 0x98, 0x83})), bytes({0x26, 0x03}));
  EXPECT_EQ(utf8_to_utf16be(bytes({0xF0, 0x9F, 0x98, 0x80})), bytes({0xD8, 0x3D, 0xDE, 0x00}));
  EXPECT_EQ(utf8_to_utf16be(""), "");

  // Invalid input becomes U+FFFD
  EXPECT_EQ(utf8_to_utf16be(bytes({0xFF})), bytes({0xFF, 0xFD}));
}

TEST(TextEncodingTest, HexToBytes) {
  EXPECT_EQ(hex_to_bytes("4a4B"), "JK");
  EXPECT_EQ(hex_to_bytes("00ff"), bytes({0x00, 0xFF}));
  EXPECT_FALSE(hex_to_bytes("").has_value());
  EXPECT_FALSE(hex_to_bytes("abc").has_value());
  EXPECT_FALSE(hex_to_bytes("zz").has_value());
  EXPECT_FALSE(hex_to_bytes("12 4").has_value());
}

TEST(Base64Test, EncodesStandardAlphabetWithPadding) {
  EXPECT_EQ(Base64::encode(""), "");
  EXPECT_EQ(Base64::encode("f"), "Zg==");
  EXPECT_EQ(Base64::encode("fo"), "Zm8=");
  EXPECT_EQ(Base64::encode("foo"), "Zm9v");
  EXPECT_EQ(Base64::encode("hello"), "aGVsbG8=");
  EXPECT_EQ(Base64::encode(bytes({0xFE, 0xFF, 0x00, 0x41})), "/v8AQQ==");
}

TEST(Base64Test, DecodesValidInput) {
  EXPECT_EQ(Base64::decode(""), "");
  EXPECT_EQ(Base64::decode("aGVsbG8="), "hello");
  EXPECT_EQ(Base64::decode("Zm9v"), "foo");
  EXPECT_EQ(Base64::decode("/v8AQQ=="), bytes({0xFE, 0xFF, 0x00, 0x41}));
}

TEST(Base64Test, RejectsInvalidCharacters) {
  EXPECT_FALSE(Base64::decode("!!!!").has_value());
  EXPECT_FALSE(Base64::decode("aGVs*G8=").has_value());
}

TEST(Base64Test, LongInputSurvivesEncodeDecode) {
  std::string data;
  for (int i = 0; i < 1000; ++i) {
    data.push_back(static_cast<char>(i % 256));
  }
  EXPECT_EQ(Base64::decode(Base64::encode(data)), data);
}
