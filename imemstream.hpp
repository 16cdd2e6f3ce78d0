#ifndef IMEMSTREAM_DOT_HPP
#define IMEMSTREAM_DOT_HPP

#include <istream>
#include <streambuf>
#include <string_view>

// Read only std::istream over borrowed memory, no copy.

struct membuf : std::streambuf {
  explicit membuf(std::string_view s)
  {
    auto p = const_cast<char*>(s.data());
    this->setg(p, p, p + s.size());
  }
};

struct imemstream : virtual membuf, std::istream {
  explicit imemstream(std::string_view s)
    : membuf(s)
    , std::istream(static_cast<std::streambuf*>(this))
  {
  }
};

#endif // IMEMSTREAM_DOT_HPP
