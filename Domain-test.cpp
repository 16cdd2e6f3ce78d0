#include "Domain.hpp"

#include "Errors.hpp"
#include "is_ascii.hpp"

#include <iostream>

#include <glog/logging.h>

using namespace std::string_literals;

namespace {
bool rejected(std::string_view dom)
{
  try {
    domain::to_ascii(dom);
  }
  catch (FormatError const& e) {
    LOG(INFO) << "expected: " << e.what();
    return true;
  }
  return false;
}
} // namespace

int main(int argc, char const* argv[])
{
  google::InitGoogleLogging(argv[0]);

  CHECK_EQ(domain::to_ascii("EXAMPLE.COM"), "example.com"s);
  CHECK_EQ(domain::to_ascii("Mixed.Case.ORG"), "mixed.case.org"s);

  CHECK_EQ(domain::to_ascii("黒川.日本"), "xn--5rtw95l.xn--wgv71a"s);
  CHECK_EQ(domain::to_ascii("💩.la"), "xn--ls8h.la"s);
  CHECK_EQ(domain::to_ascii("bücher.de"), "xn--bcher-kva.de"s);
  CHECK_EQ(domain::to_ascii("BÜCHER.DE"), "xn--bcher-kva.de"s);

  // A-labels come through as they are.
  CHECK_EQ(domain::to_ascii("xn--5rtw95l.xn--wgv71a"),
           "xn--5rtw95l.xn--wgv71a"s);

  // NFKC turns the non-ASCII "5." into two ASCII characters.
  CHECK_EQ(domain::to_ascii("hi⒌com"), "hi5.com"s);

  // ASCII is only lower cased, syntax is judged later.
  CHECK_EQ(domain::to_ascii("bad_d0main.com"), "bad_d0main.com"s);

  // Not valid UTF-8.
  CHECK(rejected("\xff\xfe.com"));
  CHECK(rejected("\xc3\x28.com"));

  CHECK(is_ascii("Any ASCII string"));
  CHECK(!is_ascii("Any “non-ASCII” string"));
  CHECK(is_ascii(""));

  std::cout << domain::to_ascii("黒川.日本") << '\n';
}
