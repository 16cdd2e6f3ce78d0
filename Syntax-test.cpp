#include "Syntax.hpp"

#include "Mailbox.hpp"

#include <iostream>
#include <string>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  using Syntax::is_hostname_valid;
  using Syntax::is_plus_tag_valid;
  using Syntax::is_username_valid;

  CHECK(is_username_valid("john.doe"));
  CHECK(is_username_valid("x"));
  CHECK(is_username_valid("_______"));
  CHECK(is_username_valid("1234567890"));
  CHECK(is_username_valid("mailhost!username"));
  CHECK(is_username_valid("user%example.com"));
  CHECK(is_username_valid("{~}|'`=?^"));

  CHECK(!is_username_valid(""));
  CHECK(!is_username_valid("john..doe"));
  CHECK(!is_username_valid(".john"));
  CHECK(!is_username_valid("john."));
  CHECK(!is_username_valid("just\"not\"right"));
  CHECK(!is_username_valid("this is\"not\\allowed"));
  CHECK(!is_username_valid("a(b)c"));
  CHECK(!is_username_valid("あいうえお"));

  // Quoted strings.
  CHECK(is_username_valid("\"a\\\"b\""));
  CHECK(is_username_valid("\"john..doe\""));
  CHECK(is_username_valid("\" \""));
  CHECK(is_username_valid("\"\\<foo-bar\\>\""));
  CHECK(is_username_valid("\"\""));
  CHECK(!is_username_valid("\"a\"b\""));
  CHECK(!is_username_valid("\"a\\\""));
  CHECK(!is_username_valid("\"a\rb\""));
  CHECK(!is_username_valid("\"a\nb\""));
  CHECK(!is_username_valid("\"unterminated"));

  auto const u64 = std::string(64, 'u');
  CHECK(is_username_valid(u64));
  CHECK(!is_username_valid(u64 + 'u'));

  CHECK(is_plus_tag_valid(""));
  CHECK(is_plus_tag_valid("tag"));
  CHECK(is_plus_tag_valid("tag.sorting"));
  CHECK(is_plus_tag_valid("tag+more"));
  CHECK(is_plus_tag_valid("..."));
  CHECK(!is_plus_tag_valid("has space"));
  CHECK(!is_plus_tag_valid("a\"b"));

  CHECK(is_hostname_valid("example.com"));
  CHECK(is_hostname_valid("domain"));
  CHECK(is_hostname_valid("a-b.c--d.e"));
  CHECK(is_hostname_valid("111.222.333.44444"));
  CHECK(is_hostname_valid("xn--5rtw95l.xn--wgv71a"));

  CHECK(!is_hostname_valid(""));
  CHECK(!is_hostname_valid(".example.com"));
  CHECK(!is_hostname_valid("example.com."));
  CHECK(!is_hostname_valid("domain..com"));
  CHECK(!is_hostname_valid("-domain.com"));
  CHECK(!is_hostname_valid("domain-.com"));
  CHECK(!is_hostname_valid("bad_d0main.com"));
  CHECK(!is_hostname_valid("[123.123.123.123]"));

  auto const l63 = std::string(63, 'x');
  CHECK(is_hostname_valid(l63 + ".com"));
  CHECK(!is_hostname_valid(l63 + "x.com"));

  // 4 * 63 + 3 dots = 255
  auto const l4 = l63 + '.' + l63 + '.' + l63 + '.' + l63;
  CHECK(!is_hostname_valid(l4));
  // 3 * 63 + 61 + 3 dots = 253
  auto const l253 = l63 + '.' + l63 + '.' + l63 + '.' + std::string(61, 'x');
  CHECK_EQ(l253.length(), 253U);
  CHECK(is_hostname_valid(l253));

  auto const all_good
      = Syntax::check(Mailbox::parse("first.last+tag@Example.COM"));
  CHECK(all_good.all());
  CHECK(all_good == (Syntax::Data{true, true, true}));

  auto const bad_host = Syntax::check(Mailbox::parse("first@-example.com"));
  CHECK(bad_host.username);
  CHECK(bad_host.plus_tag);
  CHECK(!bad_host.hostname);
  CHECK(!bad_host.all());

  auto const bad_user = Syntax::check(Mailbox::parse("a..b+x@example.com"));
  CHECK(!bad_user.username);
  CHECK(bad_user.hostname);

  std::cout << all_good << '\n' << bad_host << '\n';
}
