#include "codec/value_codec.hpp"
#include "codec/base64.hpp"
#include "codec/text_encoding.hpp"
#include <boost/log/trivial.hpp>
#include <cstring>

namespace pdfmeta::codec {

namespace {

constexpr unsigned char BOM_FIRST_BIG = 0xFE;
constexpr unsigned char BOM_SECOND_BIG = 0xFF;
constexpr char UTF16BE_BOM[] = "\xFE\xFF";

bool starts_with_bom(const std::string& bytes, unsigned char first, unsigned char second) {
  return bytes.size() >= 2
      && static_cast<unsigned char>(bytes[0]) == first
      && static_cast<unsigned char>(bytes[1]) == second;
}

// Formats each Info value kind for display
struct TextFormatter {
  std::string operator()(const TextValue& value) const { return ValueCodec::decode(value.bytes); }
  std::string operator()(const NameValue& value) const { return utf8_lossy(value.bytes); }
  std::string operator()(int64_t value) const { return std::to_string(value); }
  std::string operator()(const RealValue& value) const { return value.text; }
  std::string operator()(bool value) const { return value ? "true" : "false"; }
  std::string operator()(const NullValue&) const { return "null"; }
  std::string operator()(const OtherValue& value) const {
    return "<unprocessed type " + value.kind + ">";
  }
};

} // namespace

//==============================================
// DECODING
//==============================================

std::string ValueCodec::decode(const std::string& raw_bytes) {
  if (auto decoded = decode_with_bom(raw_bytes)) {
    return *decoded;
  }

  // The remaining stages work on the UTF-8 form
  const std::string text = utf8_lossy(raw_bytes);

  if (auto decoded = decode_hex_wrapped(text)) {
    return *decoded;
  }

  // A malformed tagged value falls through and comes back unchanged
  if (auto decoded = decode_tagged_base64(text)) {
    return *decoded;
  }

  return text;
}

std::string ValueCodec::to_text(const InfoValue& value) {
  return std::visit(TextFormatter{}, value);
}

std::optional<std::string> ValueCodec::decode_with_bom(const std::string& bytes) {
  if (starts_with_bom(bytes, BOM_FIRST_BIG, BOM_SECOND_BIG)) {
    if (auto decoded = utf16_to_utf8(bytes.substr(2), Utf16Order::BigEndian)) {
      return decoded;
    }
    BOOST_LOG_TRIVIAL(debug) << "Codec: Invalid UTF-16BE content after byte-order mark";
  }

  if (starts_with_bom(bytes, BOM_SECOND_BIG, BOM_FIRST_BIG)) {
    if (auto decoded = utf16_to_utf8(bytes.substr(2), Utf16Order::LittleEndian)) {
      return decoded;
    }
    BOOST_LOG_TRIVIAL(debug) << "Codec: Invalid UTF-16LE content after byte-order mark";
  }

  return std::nullopt;
}

std::optional<std::string> ValueCodec::decode_hex_wrapped(const std::string& text) {
  if (text.size() < 4 || text.front() != '<' || text.back() != '>') {
    return std::nullopt;
  }

  auto bytes = hex_to_bytes(text.substr(1, text.size() - 2));
  if (!bytes) {
    return std::nullopt;
  }

  if (auto decoded = decode_with_bom(*bytes)) {
    return decoded;
  }
  return utf8_lossy(*bytes);
}

std::optional<std::string> ValueCodec::decode_tagged_base64(const std::string& text) {
  const size_t prefix_length = std::strlen(TAGGED_UTF16BE_PREFIX);
  if (text.compare(0, prefix_length, TAGGED_UTF16BE_PREFIX) != 0) {
    return std::nullopt;
  }

  auto bytes = Base64::decode(text.substr(prefix_length));
  if (!bytes || bytes->empty()) {
    BOOST_LOG_TRIVIAL(debug) << "Codec: Tagged value has no valid base64 payload";
    return std::nullopt;
  }

  std::string units = *bytes;
  if (starts_with_bom(units, BOM_FIRST_BIG, BOM_SECOND_BIG)) {
    units.erase(0, 2);
  }

  auto decoded = utf16_to_utf8(units, Utf16Order::BigEndian);
  if (!decoded) {
    BOOST_LOG_TRIVIAL(debug) << "Codec: Tagged value payload is not valid UTF-16BE";
  }
  return decoded;
}


//==============================================
// ENCODING
//==============================================

std::string ValueCodec::encode(const std::string& text) {
  return text;
}

std::string ValueCodec::encode_tagged_utf16be(const std::string& text) {
  const std::string units = std::string(UTF16BE_BOM) + utf8_to_utf16be(text);
  return TAGGED_UTF16BE_PREFIX + Base64::encode(units);
}

std::string ValueCodec::encode_for_storage(const std::string& text, bool use_tagged) {
  return use_tagged ? encode_tagged_utf16be(text) : encode(text);
}

} // namespace pdfmeta::codec
