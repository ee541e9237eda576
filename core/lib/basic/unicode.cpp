// namecheck/basic/unicode.cpp - UTF-8 decoding and classification
//
#include "namecheck/basic/unicode.hpp"

#include <unicode/uchar.h>

namespace namecheck
{

namespace
{

bool is_continuation(unsigned char b) noexcept { return (b & 0xC0) == 0x80; }

// Shortest-form, non-surrogate, in-range scalar values only
bool is_well_formed(char32_t cp, size_t length) noexcept
{
  static constexpr char32_t k_min_for_length[] = {0, 0, 0x80, 0x800, 0x10000};
  if (cp < k_min_for_length[length]) {
    return false;
  }
  if (cp >= 0xD800 && cp <= 0xDFFF) {
    return false;
  }
  return cp <= 0x10FFFF;
}

}  // namespace

std::pair<char32_t, size_t> decode_utf8(std::string_view s, size_t i) noexcept
{
  const auto b0 = static_cast<unsigned char>(s[i]);
  if (b0 < 0x80) {
    return {b0, 1};
  }

  size_t length = 0;
  char32_t cp = 0;
  if ((b0 & 0xE0) == 0xC0) {
    length = 2;
    cp = b0 & 0x1F;
  } else if ((b0 & 0xF0) == 0xE0) {
    length = 3;
    cp = b0 & 0x0F;
  } else if ((b0 & 0xF8) == 0xF0) {
    length = 4;
    cp = b0 & 0x07;
  } else {
    return {k_replacement_char, 1};
  }

  if (i + length > s.size()) {
    return {k_replacement_char, 1};
  }
  for (size_t k = 1; k < length; ++k) {
    const auto b = static_cast<unsigned char>(s[i + k]);
    if (!is_continuation(b)) {
      return {k_replacement_char, 1};
    }
    cp = (cp << 6) | static_cast<char32_t>(b & 0x3F);
  }

  if (!is_well_formed(cp, length)) {
    return {k_replacement_char, 1};
  }
  return {cp, length};
}

bool is_upper(char32_t cp)
{
  if (cp < 0x80) {
    return cp >= U'A' && cp <= U'Z';
  }
  return u_isUUppercase(static_cast<UChar32>(cp)) != 0;
}

bool is_lower(char32_t cp)
{
  if (cp < 0x80) {
    return cp >= U'a' && cp <= U'z';
  }
  return u_isULowercase(static_cast<UChar32>(cp)) != 0;
}

bool is_digit(char32_t cp)
{
  if (cp < 0x80) {
    return cp >= U'0' && cp <= U'9';
  }
  return u_isdigit(static_cast<UChar32>(cp)) != 0;
}

size_t code_point_count(std::string_view s) noexcept
{
  size_t count = 0;
  CodePointReader reader(s);
  while (!reader.at_end()) {
    reader.next();
    ++count;
  }
  return count;
}

}  // namespace namecheck
