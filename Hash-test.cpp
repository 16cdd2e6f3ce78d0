#include "Hash.hpp"

#include <iostream>

#include <glog/logging.h>

using namespace std::string_literals;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  CHECK_EQ(Hash::of(""), "d41d8cd98f00b204e9800998ecf8427e"s);
  CHECK_EQ(Hash::of("The quick brown fox jumps over the lazy dog"),
           "9e107d9d372bb6826bd81d3542a419d6"s);

  Hash h;
  h.update("The quick brown fox ");
  h.update("jumps over the lazy dog");
  CHECK_EQ(h.final(), Hash::of("The quick brown fox jumps over the lazy dog"));

  std::cout << Hash::of("test@example.com") << '\n';
}
