#include "Verifier.hpp"

#include "Errors.hpp"
#include "HTTP.hpp"

#include <atomic>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>

#include <unistd.h>

#include <glog/logging.h>

using namespace std::string_literals;

namespace {
// Canned bodies by URL; anything else is a 404.  Avatar lookups come
// in from several threads at once.
class Fake_fetcher : public HTTP::Fetcher {
public:
  HTTP::Response get(std::string const& url) override
  {
    std::lock_guard<std::mutex> lock(mtx_);
    ++gets_;
    auto const it = pages_.find(url);
    if (it == end(pages_))
      return HTTP::Response{404, "", ""};
    return it->second;
  }

  void set(std::string const& url, unsigned status, std::string body)
  {
    std::lock_guard<std::mutex> lock(mtx_);
    pages_[url] = HTTP::Response{status, std::move(body), ""};
  }

  int gets() const
  {
    std::lock_guard<std::mutex> lock(mtx_);
    return gets_;
  }

private:
  mutable std::mutex                    mtx_;
  std::map<std::string, HTTP::Response> pages_;
  int                                   gets_{0};
};

class Fake_resolver : public DNS::MX_resolver {
public:
  DNS::RR_MX_collection get_mx_records(std::string const& hostname) override
  {
    if (hostname == "broken-dns.com")
      throw ConnectionError("SERVFAIL");
    if ((hostname == "example.com") || (hostname == "gmail.com")
        || (hostname == "mailinator.com"))
      return {{"mx." + hostname, 10}};
    return {};
  }
};

std::shared_ptr<Fake_fetcher> make_fetcher()
{
  auto fetcher = std::make_shared<Fake_fetcher>();
  fetcher->set(Config::psl_url_default, 200,
               "// test suffixes\ncom\nuk\nco.uk\n");
  fetcher->set(Config::disposable_url_default, 200, "mailinator.com\n");
  fetcher->set(Config::free_url_default, 200, "gmail.com\nyahoo.com\n");
  fetcher->set(Config::role_url_default, 200, "admin\ninfo\npostmaster\n");
  return fetcher;
}

struct Counting_connector {
  std::shared_ptr<std::atomic<int>> calls{
      std::make_shared<std::atomic<int>>(0)};

  std::unique_ptr<Sock> operator()(std::string const& host,
                                   uint16_t,
                                   std::chrono::milliseconds) const
  {
    ++*calls;
    throw ConnectionError("no route to " + host);
  }
};

bool all_skipped_but_syntax(Validation_result const& res)
{
  return Check::is_skipped(res.registrability) && Check::is_skipped(res.mx)
         && Check::is_skipped(res.disposable) && Check::is_skipped(res.avatar)
         && Check::is_skipped(res.free) && Check::is_skipped(res.role_based)
         && Check::is_skipped(res.smtp);
}

void write_file(fs::path const& path, std::string const& contents)
{
  std::ofstream(path) << contents;
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto fetcher  = make_fetcher();
  auto resolver = std::make_shared<Fake_resolver>();

  Config::Settings settings;
  settings.smtp.enabled = true;
  Counting_connector connector;

  auto verifier = Verifier::create(settings, fetcher, resolver, connector);

  {
    // More than one '@': only syntax runs.
    auto const res = verifier.verify("bad@@example.com");
    CHECK_EQ(res.email, "bad@@example.com"s);
    CHECK(Check::is_failed(res.syntax));
    CHECK(res.parts.empty());
    CHECK(all_skipped_but_syntax(res));
    CHECK(!res.likely_deliverable());
  }

  {
    // The plain good case; SMTP can't connect so it's Errored, which
    // doesn't count against the address.
    auto const res = verifier.verify("User+news@example.com");
    CHECK_EQ(res.parts.username(), "User"s);
    CHECK_EQ(res.parts.plus_tag(), "news"s);
    CHECK_EQ(res.parts.hostname(), "example.com"s);

    CHECK(Check::is_passed(res.syntax));
    CHECK(Check::is_passed(res.registrability));
    CHECK_EQ(*Check::data(res.registrability)->registrable_domain,
             "example.com"s);
    CHECK(Check::is_passed(res.mx));
    CHECK_EQ(Check::data(res.mx)->records.size(), 1U);
    CHECK(Check::is_passed(res.disposable));
    CHECK(Check::is_passed(res.free));
    CHECK(Check::is_passed(res.role_based));
    CHECK(Check::is_failed(res.avatar)); // 404
    CHECK(Check::is_errored(res.smtp));
    CHECK_EQ(connector.calls->load(), 2); // one host, two attempts
    CHECK(res.likely_deliverable());

    std::cout << res;
  }

  {
    // Listed as disposable.
    auto const res = verifier.verify("someone@mailinator.com");
    CHECK(Check::is_failed(res.disposable));
    auto const* data = Check::data(res.disposable);
    CHECK(data && data->match);
    CHECK_EQ(*data->matched_on, "mailinator.com"s);
    CHECK(!res.likely_deliverable());
  }

  {
    // Free provider and role account are reported, but don't decide
    // deliverability.
    auto const res = verifier.verify("Admin@gmail.com");
    CHECK(Check::is_failed(res.free));
    CHECK(Check::is_failed(res.role_based));
    CHECK(Check::is_passed(res.disposable));
    CHECK(res.likely_deliverable());
  }

  {
    // A public suffix is not registrable; no MX either, so no SMTP.
    auto const res = verifier.verify("user@co.uk");
    CHECK(Check::is_failed(res.registrability));
    CHECK(Check::is_failed(res.mx));
    CHECK(Check::is_skipped(res.smtp));
    CHECK(!res.likely_deliverable());
  }

  {
    // DNS trouble is Errored, not Failed; SMTP has nothing to go on.
    auto const res = verifier.verify("user@broken-dns.com");
    CHECK(Check::is_errored(res.mx));
    CHECK(Check::is_skipped(res.smtp));
    CHECK(res.likely_deliverable());
  }

  {
    // Bad host name: host name checks skipped, username checks run.
    auto const res = verifier.verify("info@-bad-.com");
    CHECK(Check::is_failed(res.syntax));
    CHECK(!Check::data(res.syntax)->hostname);
    CHECK(Check::data(res.syntax)->username);
    CHECK(Check::is_skipped(res.registrability));
    CHECK(Check::is_skipped(res.mx));
    CHECK(Check::is_skipped(res.disposable));
    CHECK(Check::is_skipped(res.free));
    CHECK(Check::is_skipped(res.avatar));
    CHECK(Check::is_skipped(res.smtp));
    CHECK(Check::is_failed(res.role_based));
    CHECK(!res.likely_deliverable());
  }

  {
    // Bad username: only the username checks are skipped.
    auto const res = verifier.verify("a..b@example.com");
    CHECK(Check::is_failed(res.syntax));
    CHECK(Check::is_skipped(res.role_based));
    CHECK(Check::is_skipped(res.avatar));
    CHECK(Check::is_skipped(res.smtp));
    CHECK(Check::is_passed(res.registrability));
    CHECK(Check::is_passed(res.mx));
  }

  {
    // A failed refresh keeps the old list, and is reported.
    fetcher->set(Config::disposable_url_default, 503, "");
    auto threw = false;
    try {
      verifier.refresh();
    }
    catch (ConnectionError const& e) {
      LOG(INFO) << "expected: " << e.what();
      threw = true;
    }
    CHECK(threw);
    CHECK(Check::is_failed(verifier.verify("x@mailinator.com").disposable));

    // A good refresh swaps the list in.
    fetcher->set(Config::disposable_url_default, 200, "tempmail.com\n");
    verifier.refresh();
    CHECK(Check::is_passed(verifier.verify("x@mailinator.com").disposable));
    CHECK(Check::is_failed(verifier.verify("x@tempmail.com").disposable));
  }

  {
    // Disabled checks are Skipped, and their data never fetched.
    auto fetcher2 = make_fetcher();

    Config::Settings few;
    few.registrability.enabled = false;
    few.free.enabled           = false;
    few.role_based.enabled     = false;
    few.avatar.enabled         = false;
    few.mx.enabled             = false;

    auto v = Verifier::create(few, fetcher2, resolver);
    CHECK_EQ(fetcher2->gets(), 1); // disposable list only

    auto const res = v.verify("admin@co.uk");
    CHECK(Check::is_passed(res.syntax));
    CHECK(Check::is_skipped(res.registrability));
    CHECK(Check::is_skipped(res.free));
    CHECK(Check::is_skipped(res.role_based));
    CHECK(Check::is_skipped(res.avatar));
    CHECK(Check::is_skipped(res.mx));
    CHECK(Check::is_skipped(res.smtp));
    CHECK(Check::is_passed(res.disposable));
    CHECK(res.likely_deliverable());
  }

  {
    // Data that can't be loaded fails the build of the verifier.
    auto fetcher3 = make_fetcher();
    fetcher3->set(Config::psl_url_default, 500, "");
    auto threw = false;
    try {
      Verifier::create(Config::Settings{}, fetcher3, resolver);
    }
    catch (ConnectionError const& e) {
      LOG(INFO) << "expected: " << e.what();
      threw = true;
    }
    CHECK(threw);
  }

  {
    // Offline, from files in the data directory; nothing fetched.
    auto const dir = fs::temp_directory_path()
                     / ("Verifier-test-" + std::to_string(getpid()));
    fs::create_directories(dir);
    write_file(dir / Config::psl_file_default, "com\n");
    write_file(dir / Config::disposable_file_default, "trashmail.com\n");
    write_file(dir / Config::free_file_default, "gmail.com\n");
    write_file(dir / Config::role_file_default, "sales\n");

    auto fetcher4 = std::make_shared<Fake_fetcher>();

    Config::Settings offline;
    offline.all_offline  = true;
    offline.data_dir     = dir;
    offline.smtp.enabled = true;

    auto v = Verifier::create(offline, fetcher4, resolver, connector);

    auto const res = v.verify("sales@trashmail.com");
    CHECK(Check::is_passed(res.registrability));
    CHECK(Check::is_failed(res.disposable));
    CHECK(Check::is_passed(res.free));
    CHECK(Check::is_failed(res.role_based));
    CHECK(Check::is_skipped(res.mx));
    CHECK(Check::is_skipped(res.avatar));
    CHECK(Check::is_skipped(res.smtp));
    CHECK_EQ(fetcher4->gets(), 0);

    fs::remove_all(dir);
  }

  {
    // A hand assembled verifier with nothing but syntax.
    Verifier v{Verifier::Checkers{}};
    auto const res = v.verify("user@example.com");
    CHECK(Check::is_passed(res.syntax));
    CHECK(all_skipped_but_syntax(res));
    CHECK(res.likely_deliverable());
    v.refresh(); // nothing to do
  }
}
