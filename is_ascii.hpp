#ifndef IS_ASCII_DOT_HPP
#define IS_ASCII_DOT_HPP

#include <string_view>

constexpr bool is_ascii_char(char c) noexcept
{
  return (static_cast<unsigned char>(c) & 0x80) == 0;
}

constexpr bool is_ascii(std::string_view str) noexcept
{
  for (auto ch : str) {
    if (!is_ascii_char(ch))
      return false;
  }
  return true;
}

#endif // IS_ASCII_DOT_HPP
