#include "TLD.hpp"

#include "Errors.hpp"
#include "Provider.hpp"

#include <atomic>
#include <iostream>
#include <thread>
#include <vector>

#include <glog/logging.h>

using namespace std::string_literals;

namespace {
// Serves whatever text it's been given, or fails.
class Scripted_provider : public Provider {
public:
  Scripted_provider(std::string& text, bool& fail)
    : text_(text)
    , fail_(fail)
  {
  }

  std::string name() const override { return "scripted"; }
  std::string obtain() override
  {
    if (fail_)
      throw ConnectionError("scripted failure");
    return text_;
  }

private:
  std::string& text_;
  bool&        fail_;
};

void none(TLD const& tld, char const* host)
{
  auto const reg = tld.get_registered_domain(host);
  CHECK(!reg) << host << " has registrable domain " << *reg;
}

void registrable(TLD const& tld, char const* host, char const* expected)
{
  auto const reg = tld.get_registered_domain(host);
  CHECK(reg) << host << " not registrable";
  CHECK_EQ(*reg, std::string(expected));
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  {
    TLD tld{std::vector<std::string>{"com", "co.uk"}};
    CHECK_EQ(tld.size(), 2U);

    registrable(tld, "example.com", "example.com");
    registrable(tld, "pi.digilicious.com", "digilicious.com");
    registrable(tld, "outmail14.phi.meetup.com", "meetup.com");
    registrable(tld, "EXAMPLE.Com", "example.com");
    registrable(tld, "foo.co.uk", "foo.co.uk");
    registrable(tld, "www.foo.co.uk", "foo.co.uk");

    none(tld, "com");
    none(tld, "co.uk");
    none(tld, "uk"); // only co.uk is a rule, but one label is never enough
    none(tld, "example.org");
    none(tld, "not_a_domain_at_all");
    none(tld, ".com");
    none(tld, ".");
    none(tld, "");
  }

  {
    TLD tld{std::vector<std::string>{"*.ck"}};
    none(tld, "a.ck");
    registrable(tld, "b.a.ck", "b.a.ck");
    registrable(tld, "c.b.a.ck", "b.a.ck");
  }

  {
    TLD tld{std::vector<std::string>{"*.ck", "!pref.ck"}};
    none(tld, "foo.ck");
    registrable(tld, "pref.ck", "pref.ck");
    registrable(tld, "b.pref.ck", "pref.ck");
  }

  {
    // Junk lines are skipped, the rest still load.
    TLD tld{std::vector<std::string>{"com", "not a rule", "*.*.x", "!", "net"}};
    CHECK_EQ(tld.size(), 2U);
    registrable(tld, "example.net", "example.net");
  }

  {
    // Rules are trimmed before they're judged.
    TLD tld{std::vector<std::string>{" com", "co.uk\r", "\t*.ck ", "  "}};
    CHECK_EQ(tld.size(), 3U);
    registrable(tld, "example.com", "example.com");
    registrable(tld, "foo.co.uk", "foo.co.uk");
    registrable(tld, "b.a.ck", "b.a.ck");
  }

  {
    // Unicode rules are converted to A-labels, comment banners are
    // skipped like any other line that isn't a rule.
    std::string text = "// ===BEGIN ICANN DOMAINS===\n"
                       "// 公司.cn : https://en.wikipedia.org/wiki/.cn\n"
                       "cn\n"
                       "公司.cn\n"
                       "*.日本\n"
                       "\n";
    auto fail = false;
    TLD  tld{std::make_unique<Scripted_provider>(text, fail)};
    CHECK_EQ(tld.size(), 3U);
    registrable(tld, "example.xn--55qx5d.cn", "example.xn--55qx5d.cn");
    registrable(tld, "example.cn", "example.cn");
    none(tld, "a.xn--wgv71a");
    registrable(tld, "b.a.xn--wgv71a", "b.a.xn--wgv71a");
  }

  CHECK(TLD::is_rule("com"));
  CHECK(TLD::is_rule("co.uk"));
  CHECK(TLD::is_rule("*.ck"));
  CHECK(TLD::is_rule("!www.ck"));
  CHECK(TLD::is_rule("xn--p1ai"));
  CHECK(!TLD::is_rule(""));
  CHECK(!TLD::is_rule("a b"));
  CHECK(!TLD::is_rule("ck.*"));
  CHECK(!TLD::is_rule(".com"));

  {
    std::string text = "// comment\ncom\n\nblogspot.com\n";
    auto        fail = false;
    TLD tld{std::make_unique<Scripted_provider>(text, fail), {"example.com"}};

    CHECK_EQ(tld.size(), 3U);
    registrable(tld, "foo.blogspot.com", "foo.blogspot.com");
    registrable(tld, "www.example.com", "www.example.com");
    registrable(tld, "reward.yournewestbonuspoints.com",
                "yournewestbonuspoints.com");

    // A failed refresh leaves the old trie in place.
    fail       = true;
    auto threw = false;
    try {
      tld.refresh();
    }
    catch (ConnectionError const& e) {
      threw = true;
    }
    CHECK(threw);
    registrable(tld, "foo.blogspot.com", "foo.blogspot.com");

    fail = false;
    text = "org\n";
    tld.refresh();
    CHECK_EQ(tld.size(), 2U); // org plus the custom rule
    none(tld, "example.com");
    registrable(tld, "example.org", "example.org");
    registrable(tld, "www.example.com", "www.example.com");
  }

  {
    // Lookups running while the trie is rebuilt over and over see one
    // complete trie or the other, never a partial one.
    std::string const with_co_uk = "uk\nco.uk\n";
    std::string const without    = "uk\n";

    std::string text = with_co_uk;
    auto        fail = false;
    TLD tld{std::make_unique<Scripted_provider>(text, fail)};

    std::atomic<bool> done{false};
    std::atomic<int>  reads{0};

    std::vector<std::thread> readers;
    for (auto i = 0; i < 4; ++i) {
      readers.emplace_back([&] {
        while (!done) {
          auto const reg = tld.get_registered_domain("foo.co.uk");
          CHECK(reg) << "foo.co.uk not registrable mid-refresh";
          CHECK((*reg == "foo.co.uk") || (*reg == "co.uk")) << *reg;
          ++reads;
        }
      });
    }

    for (auto i = 0; i < 200; ++i) {
      text = (i % 2) ? with_co_uk : without;
      tld.refresh();
    }
    // Make sure lookups really ran alongside.
    while (reads < 4)
      std::this_thread::yield();
    done = true;
    for (auto& reader : readers)
      reader.join();

    CHECK_GE(reads.load(), 4);
    registrable(tld, "foo.co.uk", "foo.co.uk"); // last refresh had co.uk
  }

  std::cout << "sizeof(TLD) == " << sizeof(TLD) << '\n';
}
