#include "esc.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

namespace {
char const* named_escape(char c)
{
  switch (c) {
  case '\a': return "\\a";
  case '\b': return "\\b";
  case '\f': return "\\f";
  case '\n': return "\\n";
  case '\r': return "\\r";
  case '\t': return "\\t";
  case '\v': return "\\v";
  case '\\': return "\\\\";
  }
  return nullptr;
}
} // namespace

std::string esc(std::string_view str, esc_line_option line_option)
{
  auto const plain = std::all_of(begin(str), end(str), [](unsigned char c) {
    return std::isprint(c) && (c != '\\');
  });
  if (plain)
    return std::string(str);

  std::string ret;
  ret.reserve(str.length() * 2);
  for (auto c : str) {
    if (auto const named = named_escape(c)) {
      ret += named;
      if ((c == '\n') && (line_option == esc_line_option::multi))
        ret += '\n';
    }
    else if (std::isprint(static_cast<unsigned char>(c))) {
      ret += c;
    }
    else {
      ret += fmt::format("\\x{:02x}", static_cast<unsigned char>(c));
    }
  }

  // No trailing newline, the logger adds one.
  if ((line_option == esc_line_option::multi) && !ret.empty()
      && (ret.back() == '\n'))
    ret.pop_back();

  return ret;
}
