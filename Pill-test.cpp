#include "Pill.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <string>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  Pill red, blue;
  CHECK(red != blue);

  std::stringstream red_str, blue_str;

  red_str << red;
  blue_str << blue;

  CHECK_NE(red_str.str(), blue_str.str());

  CHECK_EQ(13U, red_str.str().length());
  CHECK_EQ(13U, blue_str.str().length());

  // Only z-base-32 digits, so always a plain dot-atom.
  std::string const charset{"ybndrfg8ejkmcpqxot1uwisza345h769"};
  auto const        s = red.as_string_view();
  CHECK(std::all_of(begin(s), end(s), [&charset](char c) {
    return charset.find(c) != std::string::npos;
  }));

  Pill red2(red);
  CHECK_EQ(red, red2);
  CHECK_EQ(red.as_string_view(), red2.as_string_view());

  std::cout << "sizeof(Pill) == " << sizeof(Pill) << '\n';
  std::cout << red << '\n' << blue << '\n';
}
