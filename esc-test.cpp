#include "esc.hpp"

#include "fs.hpp"
#include "imemstream.hpp"

#include <iostream>
#include <string>

#include <glog/logging.h>

#include <boost/iostreams/device/mapped_file.hpp>

using namespace std::string_literals;

int main(int argc, char* argv[])
{
  auto const s0 = "\a\xa0\b\t\n\v\f\r\\";
  CHECK_EQ(esc(s0), "\\a\\xa0\\b\\t\\n\\v\\f\\r\\\\");

  auto const s1 = "no characters to escape";
  CHECK_EQ(esc(s1), s1);

  CHECK_EQ(esc("250 OK\r\n"), "250 OK\\r\\n"s);
  CHECK_EQ(esc("250-one\r\n250 two\r\n", esc_line_option::multi),
           "250-one\\r\\n\n250 two\\r\\n"s);
  CHECK_EQ(esc("\x01\x7f"), "\\x01\\x7f"s);

  // Escape the files named on the command line.
  for (auto arg = 1; arg < argc; ++arg) {
    fs::path const path{argv[arg]};

    auto const body_sz{fs::file_size(path)};
    if (!body_sz)
      continue;

    boost::iostreams::mapped_file_source file_source{};
    file_source.open(path.string());

    imemstream  isfile{std::string_view(file_source.data(), file_source.size())};
    std::string line;
    while (std::getline(isfile, line)) {
      if (!isfile.eof())
        line += '\n'; // since getline strips the newline
      std::cout << esc(line, esc_line_option::multi) << '\n';
    }
  }
}
