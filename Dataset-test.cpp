#include "Dataset.hpp"

#include "Errors.hpp"
#include "Provider.hpp"

#include <atomic>
#include <iostream>
#include <thread>
#include <vector>

#include <glog/logging.h>

using namespace std::string_literals;

namespace {
std::unique_ptr<Provider> fixed(std::vector<std::string> lines)
{
  return std::make_unique<FixedProvider>(std::move(lines));
}

class Failing_provider : public Provider {
public:
  explicit Failing_provider(bool& fail)
    : fail_(fail)
  {
  }
  std::string name() const override { return "failing"; }
  std::string obtain() override
  {
    if (fail_)
      throw ConnectionError("no data today");
    return "spam.example\n";
  }

private:
  bool& fail_;
};

// Serves whatever text it currently points at.
class Switching_provider : public Provider {
public:
  explicit Switching_provider(std::string const*& text)
    : text_(text)
  {
  }
  std::string name() const override { return "switching"; }
  std::string obtain() override { return *text_; }

private:
  std::string const*& text_;
};
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  using Dataset::Data;
  using Dataset::key_type;
  using Dataset::source;

  CHECK((Dataset::hostname_candidates("a.b.mailinator.com")
         == std::vector<std::string>{"a.b.mailinator.com", "b.mailinator.com",
                                     "mailinator.com"}));
  CHECK((Dataset::hostname_candidates("mailinator.com")
         == std::vector<std::string>{"mailinator.com"}));
  CHECK(Dataset::hostname_candidates("localhost").empty());
  CHECK(Dataset::hostname_candidates("").empty());

  {
    Dataset::Matcher dm{key_type::hostname, fixed({"mailinator.com"})};
    CHECK_EQ(dm.size(), 1U);

    auto const hit = dm.check("a.b.mailinator.com");
    CHECK(hit.match);
    CHECK_EQ(*hit.matched_on, "mailinator.com"s);
    CHECK(hit.src == source::dflt);

    auto const exact = dm.check("mailinator.com");
    CHECK(exact.match);
    CHECK_EQ(*exact.matched_on, "mailinator.com"s);

    CHECK(dm.check("gmail.com") == Data{});
    CHECK(dm.check("com") == Data{});
    CHECK(dm.check("notmailinator.com") == Data{});
  }

  {
    // Allow beats deny beats the base list.
    Dataset::Matcher dm{key_type::hostname,
                        fixed({"mailinator.com", "guerrillamail.com"}),
                        {"mailinator.com"},
                        {"mailinator.com", "example.org"}};

    auto const allowed = dm.check("mailinator.com");
    CHECK(!allowed.match);
    CHECK_EQ(*allowed.matched_on, "mailinator.com"s);
    CHECK(allowed.src == source::allow);

    auto const denied = dm.check("mx.example.org");
    CHECK(denied.match);
    CHECK_EQ(*denied.matched_on, "example.org"s);
    CHECK(denied.src == source::deny);

    auto const base = dm.check("guerrillamail.com");
    CHECK(base.match);
    CHECK(base.src == source::dflt);
  }

  {
    // The most specific candidate wins.
    Dataset::Matcher dm{key_type::hostname, fixed({"example.com"}),
                        {"good.example.com"}};
    auto const allowed = dm.check("x.good.example.com");
    CHECK(!allowed.match);
    CHECK_EQ(*allowed.matched_on, "good.example.com"s);

    auto const hit = dm.check("bad.example.com");
    CHECK(hit.match);
    CHECK_EQ(*hit.matched_on, "example.com"s);
  }

  {
    // Usernames match exactly, no parent lookups.
    Dataset::Matcher dm{key_type::exact, fixed({"admin", "info", "no.reply"})};
    CHECK(dm.check("admin").match);
    CHECK(dm.check("no.reply").match);
    CHECK(!dm.check("reply").match);
    CHECK(!dm.check("john.admin").match);
  }

  {
    auto             fail = false;
    Dataset::Matcher dm{key_type::hostname,
                        std::make_unique<Failing_provider>(fail)};
    CHECK(dm.check("spam.example").match);

    fail       = true;
    auto threw = false;
    try {
      dm.refresh();
    }
    catch (ConnectionError const& e) {
      threw = true;
    }
    CHECK(threw);
    CHECK(dm.check("spam.example").match);
    CHECK_EQ(dm.size(), 1U);
  }

  {
    // Checks running while the list is reloaded over and over see one
    // complete list or the other.
    std::string const  parent = "mailinator.com\nguerrillamail.com\n";
    std::string const  child  = "b.mailinator.com\nguerrillamail.com\n";
    std::string const* text   = &parent;

    Dataset::Matcher dm{key_type::hostname,
                        std::make_unique<Switching_provider>(text)};

    std::atomic<bool> done{false};
    std::atomic<int>  reads{0};

    std::vector<std::thread> readers;
    for (auto i = 0; i < 4; ++i) {
      readers.emplace_back([&] {
        while (!done) {
          auto const hit = dm.check("a.b.mailinator.com");
          CHECK(hit.match) << "no match mid-refresh";
          CHECK((*hit.matched_on == "mailinator.com")
                || (*hit.matched_on == "b.mailinator.com"))
              << *hit.matched_on;
          CHECK(dm.check("guerrillamail.com").match);
          ++reads;
        }
      });
    }

    for (auto i = 0; i < 200; ++i) {
      text = (i % 2) ? &parent : &child;
      dm.refresh();
    }
    while (reads < 4)
      std::this_thread::yield();
    done = true;
    for (auto& reader : readers)
      reader.join();

    CHECK_EQ(dm.size(), 2U);
    CHECK_EQ(*dm.check("a.b.mailinator.com").matched_on, "mailinator.com"s);
  }

  std::cout << Dataset::Data{true, "mailinator.com"s, source::deny} << '\n';
}
