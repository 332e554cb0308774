#include "typeguesser/utf8.h"

namespace typeguesser {

size_t utf8_decode(std::string_view str, size_t pos, uint32_t& codepoint) {
  if (pos >= str.size()) {
    codepoint = 0xFFFD; // Replacement character
    return 0;
  }

  uint8_t byte = static_cast<uint8_t>(str[pos]);

  // ASCII (0xxxxxxx)
  if ((byte & 0x80) == 0) {
    codepoint = byte;
    return 1;
  }

  size_t len;
  uint32_t cp;

  if ((byte & 0xE0) == 0xC0) {
    len = 2;
    cp = byte & 0x1F;
  } else if ((byte & 0xF0) == 0xE0) {
    len = 3;
    cp = byte & 0x0F;
  } else if ((byte & 0xF8) == 0xF0) {
    len = 4;
    cp = byte & 0x07;
  } else {
    // Invalid leading byte or stray continuation byte
    codepoint = 0xFFFD;
    return 1;
  }

  if (pos + len > str.size()) {
    codepoint = 0xFFFD;
    return 1;
  }

  for (size_t i = 1; i < len; ++i) {
    uint8_t cont = static_cast<uint8_t>(str[pos + i]);
    if ((cont & 0xC0) != 0x80) {
      codepoint = 0xFFFD;
      return 1;
    }
    cp = (cp << 6) | (cont & 0x3F);
  }

  // Overlong encodings
  if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) {
    codepoint = 0xFFFD;
    return len;
  }

  // Surrogates and values past the Unicode range
  if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
    codepoint = 0xFFFD;
    return len;
  }

  codepoint = cp;
  return len;
}

TextLength utf8_length(std::string_view str) {
  TextLength result;

  size_t i = 0;
  while (i < str.size() && (static_cast<uint8_t>(str[i]) & 0x80) == 0)
    ++i;
  if (i == str.size()) {
    result.code_points = str.size();
    return result;
  }

  result.code_points = i;
  size_t pos = i;
  while (pos < str.size()) {
    uint32_t cp;
    size_t len = utf8_decode(str, pos, cp);
    if (len == 0)
      break;
    ++result.code_points;
    if (cp >= 0x80)
      ++result.non_ascii;
    pos += len;
  }
  return result;
}

} // namespace typeguesser
