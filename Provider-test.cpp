#include "Provider.hpp"

#include "Errors.hpp"
#include "HTTP.hpp"

#include <fstream>
#include <iostream>

#include <unistd.h>

#include <glog/logging.h>

using namespace std::string_literals;

namespace {
class Fake_fetcher : public HTTP::Fetcher {
public:
  HTTP::Response rsp;
  std::string    last_url;

  HTTP::Response get(std::string const& url) override
  {
    last_url = url;
    return rsp;
  }
};

template <typename Fn>
bool throws_connection_error(Fn fn)
{
  try {
    fn();
  }
  catch (ConnectionError const& e) {
    LOG(INFO) << "expected: " << e.what();
    return true;
  }
  return false;
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const text = "// a comment\n"
                    "\n"
                    "  Mailinator.COM  \n"
                    "mailinator.com\n"
                    "bücher.de\r\n"
                    "\xff\xfe.bad\n"
                    "guerrillamail.com"s;
  auto const expected = std::vector<std::string>{
      "mailinator.com", "xn--bcher-kva.de", "guerrillamail.com"};
  CHECK(normalize_list(text) == expected);

  CHECK(normalize_list("").empty());
  CHECK(normalize_list("// only\n// comments\n").empty());

  FixedProvider fixed{{"ADMIN", "info", "admin"}};
  CHECK((fixed.provide() == std::vector<std::string>{"admin", "info"}));

  // Files.
  auto const path = fs::temp_directory_path()
                    / ("Provider-test-" + std::to_string(getpid()) + ".txt");
  {
    std::ofstream out(path);
    out << text;
  }
  FileProvider file{path};
  CHECK_EQ(file.name(), path.string());
  CHECK(file.provide() == expected);

  {
    std::ofstream out(path, std::ios::trunc);
  }
  CHECK(file.provide().empty());
  fs::remove(path);

  CHECK(throws_connection_error([&] { file.provide(); }));

  // URLs.
  auto fetcher  = std::make_shared<Fake_fetcher>();
  fetcher->rsp  = HTTP::Response{200, "example.com\nexample.net\n", ""};
  auto const url = "https://lists.example/domains.txt"s;
  URLProvider web{url, fetcher};
  CHECK((web.provide()
         == std::vector<std::string>{"example.com", "example.net"}));
  CHECK_EQ(fetcher->last_url, url);

  fetcher->rsp = HTTP::Response{404, "not found", ""};
  CHECK(throws_connection_error([&] { web.provide(); }));

  fetcher->rsp = HTTP::Response{503, "", ""};
  CHECK(throws_connection_error([&] { web.provide(); }));
}
