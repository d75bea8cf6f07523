#include "codec/text_encoding.hpp"
#include <boost/endian/conversion.hpp>

namespace pdfmeta::codec {

namespace {

constexpr uint32_t HIGH_SURROGATE_FIRST = 0xD800;
constexpr uint32_t HIGH_SURROGATE_LAST = 0xDBFF;
constexpr uint32_t LOW_SURROGATE_FIRST = 0xDC00;
constexpr uint32_t LOW_SURROGATE_LAST = 0xDFFF;
constexpr uint32_t SUPPLEMENTARY_BASE = 0x10000;

uint32_t load_unit(const std::string& bytes, size_t offset, Utf16Order order) {
  const auto* data = reinterpret_cast<const unsigned char*>(bytes.data() + offset);
  if (order == Utf16Order::BigEndian) {
    return boost::endian::load_big_u16(data);
  }
  return boost::endian::load_little_u16(data);
}

void append_unit(std::string& output, uint32_t unit) {
  unsigned char buffer[2];
  boost::endian::store_big_u16(buffer, static_cast<uint16_t>(unit));
  output.push_back(static_cast<char>(buffer[0]));
  output.push_back(static_cast<char>(buffer[1]));
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

//==============================================
// UTF-8
//==============================================

std::string utf8_lossy(const std::string& bytes) {
  std::string output;
  output.reserve(bytes.size());

  size_t i = 0;
  while (i < bytes.size()) {
    const auto lead = static_cast<unsigned char>(bytes[i]);
    if (lead < 0x80) {
      output.push_back(static_cast<char>(lead));
      ++i;
      continue;
    }

    // Number of continuation bytes and the accepted range of the first one (Unicode table 3-7)
    size_t needed = 0;
    unsigned char lower = 0x80;
    unsigned char upper = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
      needed = 1;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
      needed = 2;
      if (lead == 0xE0) lower = 0xA0;
      if (lead == 0xED) upper = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
      needed = 3;
      if (lead == 0xF0) lower = 0x90;
      if (lead == 0xF4) upper = 0x8F;
    } else {
      output += REPLACEMENT_CHARACTER;
      ++i;
      continue;
    }

    size_t consumed = 1;
    bool valid = true;
    for (size_t k = 0; k < needed; ++k) {
      if (i + consumed >= bytes.size()) {
        valid = false;
        break;
      }
      const auto next = static_cast<unsigned char>(bytes[i + consumed]);
      if (next < lower || next > upper) {
        valid = false;
        break;
      }
      lower = 0x80;
      upper = 0xBF;
      ++consumed;
    }

    if (valid) {
      output.append(bytes, i, consumed);
    } else {
      output += REPLACEMENT_CHARACTER;
    }
    i += consumed;
  }
  return output;
}

bool has_non_ascii(const std::string& text) {
  for (char c : text) {
    if (static_cast<unsigned char>(c) >= 0x80) {
      return true;
    }
  }
  return false;
}

void append_utf8(std::string& output, uint32_t code_point) {
  if (code_point < 0x80) {
    output.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    output.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    output.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    output.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    output.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    output.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    output.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    output.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    output.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    output.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}


//==============================================
// UTF-16
//==============================================

std::optional<std::string> utf16_to_utf8(const std::string& bytes, Utf16Order order) {
  if (bytes.size() % 2 != 0) {
    return std::nullopt;
  }

  std::string output;
  output.reserve(bytes.size());

  for (size_t i = 0; i < bytes.size(); i += 2) {
    const uint32_t unit = load_unit(bytes, i, order);
    uint32_t code_point = unit;

    if (unit >= HIGH_SURROGATE_FIRST && unit <= HIGH_SURROGATE_LAST) {
      if (i + 2 >= bytes.size()) {
        return std::nullopt;
      }
      const uint32_t low = load_unit(bytes, i + 2, order);
      if (low < LOW_SURROGATE_FIRST || low > LOW_SURROGATE_LAST) {
        return std::nullopt;
      }
      code_point = SUPPLEMENTARY_BASE + ((unit - HIGH_SURROGATE_FIRST) << 10) + (low - LOW_SURROGATE_FIRST);
      i += 2;
    } else if (unit >= LOW_SURROGATE_FIRST && unit <= LOW_SURROGATE_LAST) {
      return std::nullopt;
    }

    append_utf8(output, code_point);
  }
  return output;
}

std::string utf8_to_utf16be(const std::string& text) {
  // After lossy decoding every sequence is well formed
  const std::string clean = utf8_lossy(text);
  std::string output;
  output.reserve(clean.size() * 2);

  size_t i = 0;
  while (i < clean.size()) {
    const auto lead = static_cast<unsigned char>(clean[i]);
    uint32_t code_point = 0;
    size_t length = 1;
    if (lead < 0x80) {
      code_point = lead;
    } else if (lead < 0xE0) {
      code_point = lead & 0x1F;
      length = 2;
    } else if (lead < 0xF0) {
      code_point = lead & 0x0F;
      length = 3;
    } else {
      code_point = lead & 0x07;
      length = 4;
    }
    for (size_t k = 1; k < length; ++k) {
      code_point = (code_point << 6) | (static_cast<unsigned char>(clean[i + k]) & 0x3F);
    }
    i += length;

    if (code_point >= SUPPLEMENTARY_BASE) {
      const uint32_t offset = code_point - SUPPLEMENTARY_BASE;
      append_unit(output, HIGH_SURROGATE_FIRST + (offset >> 10));
      append_unit(output, LOW_SURROGATE_FIRST + (offset & 0x3FF));
    } else {
      append_unit(output, code_point);
    }
  }
  return output;
}


//==============================================
// HEX
//==============================================

std::optional<std::string> hex_to_bytes(const std::string& hex) {
  if (hex.empty() || hex.size() % 2 != 0) {
    return std::nullopt;
  }

  std::string output;
  output.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    const int high = hex_value(hex[i]);
    const int low = hex_value(hex[i + 1]);
    if (high < 0 || low < 0) {
      return std::nullopt;
    }
    output.push_back(static_cast<char>((high << 4) | low));
  }
  return output;
}

} // namespace pdfmeta::codec
