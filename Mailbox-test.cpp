#include "Mailbox.hpp"

#include "Errors.hpp"

#include <iostream>

#include <glog/logging.h>

#include <fmt/format.h>
#include <fmt/ostream.h>

template <>
struct fmt::formatter<Mailbox> : ostream_formatter {};

using namespace std::string_literals;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  Mailbox mb;
  CHECK(mb.empty());

  auto const dg0 = Mailbox::parse("gene@digilicious.com");
  Mailbox    dg1{"gene", "", "digilicious.com"};
  CHECK_EQ(dg0, dg1);
  CHECK(!dg0.empty());
  CHECK_EQ(dg0.as_string(), "gene@digilicious.com"s);

  // Only the first '+' splits.
  auto const tagged = Mailbox::parse("user.name+tag+sorting@Example.COM");
  CHECK_EQ(tagged.username(), "user.name"s);
  CHECK_EQ(tagged.plus_tag(), "tag+sorting"s);
  CHECK_EQ(tagged.hostname(), "example.com"s);
  CHECK_EQ(tagged.as_string(), "user.name+tag+sorting@example.com"s);
  CHECK_EQ(tagged.without_tag(), "user.name@example.com"s);

  // Case of the local part is kept.
  CHECK_EQ(Mailbox::parse("John.Doe@example.com").username(), "John.Doe"s);

  auto const idn = Mailbox::parse("실례@실례.테스트");
  CHECK_EQ(idn.username(), "실례"s);
  CHECK_EQ(idn.hostname().rfind("xn--", 0), 0U);
  CHECK_NE(idn.hostname().find(".xn--"), std::string::npos);

  auto const empty_user = Mailbox::parse("@domain.com");
  CHECK(empty_user.username().empty());
  CHECK_EQ(empty_user.hostname(), "domain.com"s);

  auto const empty_tag = Mailbox::parse("user+@domain.com");
  CHECK_EQ(empty_tag.username(), "user"s);
  CHECK(empty_tag.plus_tag().empty());

  auto threw = false;
  try {
    Mailbox::parse("bad@@example.com");
  }
  catch (FormatError const& e) {
    threw = true;
  }
  CHECK(threw);

  std::string msg;
  Mailbox     mbx;
  CHECK(Mailbox::validate("simple@example.com", msg, mbx));
  CHECK_EQ(mbx.hostname(), "example.com"s);

  CHECK(!Mailbox::validate("Abc.example.com", msg, mbx)); // (no @ character)
  CHECK_EQ(msg, "«Abc.example.com» must have exactly one '@', found 0"s);

  CHECK(!Mailbox::validate("A@b@c@example.com", msg, mbx));
  CHECK_EQ(msg, "«A@b@c@example.com» must have exactly one '@', found 3"s);

  // Invalid UTF-8 in the host name.
  CHECK(!Mailbox::validate("user@\xff.com", msg, mbx));

  std::cout << fmt::format("{}\n", tagged);
}
