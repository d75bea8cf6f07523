#ifndef PDFMETA_TEXT_ENCODING_HPP
#define PDFMETA_TEXT_ENCODING_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace pdfmeta::codec {

enum class Utf16Order {
  BigEndian,
  LittleEndian
};

// UTF-8 encoding of U+FFFD
inline constexpr char REPLACEMENT_CHARACTER[] = "\xEF\xBF\xBD";

// ---- UTF-8 ----
// Decodes bytes as UTF-8, replacing each maximal invalid subpart with U+FFFD
std::string utf8_lossy(const std::string& bytes);
// True if any byte is outside the 7-bit ASCII range
bool has_non_ascii(const std::string& text);
// Appends the UTF-8 form of a code point
void append_utf8(std::string& output, uint32_t code_point);


// ---- UTF-16 ----
// Strict UTF-16 decode to UTF-8. Fails on odd length or unpaired surrogates.
std::optional<std::string> utf16_to_utf8(const std::string& bytes, Utf16Order order);
// Encodes UTF-8 text as UTF-16BE code units, without byte-order mark.
// Invalid input sequences are encoded as U+FFFD.
std::string utf8_to_utf16be(const std::string& text);


// ---- HEX ----
// Strict hex decode. Fails on empty input, odd length or non-hex characters.
std::optional<std::string> hex_to_bytes(const std::string& hex);

} // namespace pdfmeta::codec

#endif // PDFMETA_TEXT_ENCODING_HPP
