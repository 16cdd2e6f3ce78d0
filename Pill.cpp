#include "Pill.hpp"

#include <random>

Pill::Pill()
{
  std::random_device                         rd;
  std::uniform_int_distribution<decltype(s_)> uni_dist;
  s_ = uni_dist(rd);

  // <http://philzimmermann.com/docs/human-oriented-base-32-encoding.txt>

  constexpr char b32_charset[]{"ybndrfg8ejkmcpqxot1uwisza345h769"};

  auto x = s_;
  for (auto i = b32_ndigits_; i > 0; --i) {
    b32_str_[i - 1] = b32_charset[x % 32];
    x /= 32;
  }
  b32_str_[b32_ndigits_] = '\0';
}
