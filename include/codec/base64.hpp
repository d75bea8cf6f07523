#ifndef PDFMETA_BASE64_HPP
#define PDFMETA_BASE64_HPP

#include <optional>
#include <string>

namespace pdfmeta::codec {

class Base64 {
public:
  // Standard alphabet with '=' padding, no line breaks
  static std::string encode(const std::string& bytes);
  // Strict decode. Returns nullopt on characters outside the alphabet,
  // a truncated final quantum, or misplaced padding.
  static std::optional<std::string> decode(const std::string& text);
};

} // namespace pdfmeta::codec

#endif // PDFMETA_BASE64_HPP
