#ifndef PDFMETA_VALUE_CODEC_HPP
#define PDFMETA_VALUE_CODEC_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace pdfmeta::codec {

// ---- INFO VALUE MODEL ----
// Typed value of an Info dictionary entry, independent of the PDF library
struct TextValue {
  std::string bytes;
};

// Name content without the leading '/'
struct NameValue {
  std::string bytes;
};

// Decimal text exactly as stored in the file
struct RealValue {
  std::string text;
};

struct NullValue {};

// Any structured kind (array, dictionary, stream, ...)
struct OtherValue {
  std::string kind;
};

using InfoValue = std::variant<TextValue, NameValue, int64_t, RealValue, bool, NullValue, OtherValue>;


class ValueCodec {
public:
  // Prefix of the tagged base64 convention: "UTF16BE:" followed by the
  // base64 form of UTF-16BE code units (optionally starting with a BOM)
  static constexpr const char* TAGGED_UTF16BE_PREFIX = "UTF16BE:";

  // ---- DECODING ----
  // Recovers readable text from the raw bytes of a string value. Tries, in
  // order: UTF-16BE BOM, UTF-16LE BOM, <hex> wrapper, tagged base64, and
  // finally lossy UTF-8. Never throws.
  static std::string decode(const std::string& raw_bytes);
  // Converts any Info value to its display text
  static std::string to_text(const InfoValue& value);


  // ---- ENCODING ----
  // Plain literal form written by the standard store path
  static std::string encode(const std::string& text);
  // Tagged base64 form, recovered exactly by decode()
  static std::string encode_tagged_utf16be(const std::string& text);
  // Tagged form when requested, plain literal otherwise
  static std::string encode_for_storage(const std::string& text, bool use_tagged);

private:
  // ---- DECODING STAGES ----
  // Each stage returns nullopt when its input does not fully validate
  static std::optional<std::string> decode_with_bom(const std::string& bytes);
  static std::optional<std::string> decode_hex_wrapped(const std::string& text);
  static std::optional<std::string> decode_tagged_base64(const std::string& text);
};

} // namespace pdfmeta::codec

#endif // PDFMETA_VALUE_CODEC_HPP
