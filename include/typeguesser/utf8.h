/**
 * @file utf8.h
 * @brief UTF-8 helpers for measuring string widths.
 */

#ifndef TYPEGUESSER_UTF8_H
#define TYPEGUESSER_UTF8_H

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace typeguesser {

/**
 * @brief Character counts of a UTF-8 string.
 */
struct TextLength {
  size_t code_points = 0; ///< Number of decoded code points
  size_t non_ascii = 0;   ///< How many of those are outside ASCII
};

/**
 * @brief Decode a single UTF-8 code point.
 *
 * Invalid or truncated sequences decode to U+FFFD and consume at least one
 * byte, so a loop over a malformed string always terminates.
 *
 * @param str The UTF-8 string
 * @param pos Byte position of the sequence start
 * @param codepoint Output: the decoded code point
 * @return Number of bytes consumed, 0 at end of string
 */
size_t utf8_decode(std::string_view str, size_t pos, uint32_t& codepoint);

/**
 * @brief Count the code points in a UTF-8 string.
 *
 * Pure ASCII input takes a fast path that does not decode.
 */
TextLength utf8_length(std::string_view str);

} // namespace typeguesser

#endif // TYPEGUESSER_UTF8_H
