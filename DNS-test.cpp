#include "DNS.hpp"

#include "Errors.hpp"
#include "HTTP.hpp"

#include <iostream>
#include <stdexcept>

#include <glog/logging.h>

#include <fmt/format.h>
#include <fmt/ostream.h>

template <>
struct fmt::formatter<DNS::RR_MX> : ostream_formatter {};

using namespace std::string_literals;

namespace {
class Fake_fetcher : public HTTP::Fetcher {
public:
  HTTP::Response rsp;
  std::string    last_url;
  bool           blow_up{false};

  HTTP::Response get(std::string const& url) override
  {
    last_url = url;
    if (blow_up)
      throw std::runtime_error("socket on fire");
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

auto constexpr gmail_reply = R"({
  "Status": 0, "TC": false, "RD": true, "RA": true,
  "Question": [ { "name": "gmail.com.", "type": 15 } ],
  "Answer": [
    { "name": "gmail.com.", "type": 15, "TTL": 3600, "data": "20 alt2.gmail-smtp-in.l.google.com." },
    { "name": "gmail.com.", "type": 15, "TTL": 3600, "data": "5 gmail-smtp-in.l.google.com." },
    { "name": "gmail.com.", "type": 15, "TTL": 3600, "data": "10 alt1.gmail-smtp-in.l.google.com." },
    { "name": "gmail.com.", "type": 5, "TTL": 3600, "data": "elsewhere.example." },
    { "name": "gmail.com.", "type": 15, "TTL": 3600, "data": "not an mx" },
    { "name": "gmail.com.", "type": 15, "TTL": 3600, "data": "20 alt3.gmail-smtp-in.l.google.com." }
  ]
})";
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const mxs = DNS::parse_doh_reply(gmail_reply);
  CHECK_EQ(mxs.size(), 4U);
  CHECK_EQ(mxs[0], (DNS::RR_MX{"gmail-smtp-in.l.google.com", 5}));
  CHECK_EQ(mxs[1], (DNS::RR_MX{"alt1.gmail-smtp-in.l.google.com", 10}));
  // Ties keep answer order.
  CHECK_EQ(mxs[2], (DNS::RR_MX{"alt2.gmail-smtp-in.l.google.com", 20}));
  CHECK_EQ(mxs[3], (DNS::RR_MX{"alt3.gmail-smtp-in.l.google.com", 20}));

  CHECK(DNS::parse_doh_reply(R"({"Status": 3})").empty());
  CHECK(DNS::parse_doh_reply(R"({"Status": 0, "Answer": []})").empty());
  CHECK(DNS::parse_doh_reply(
            R"({"Answer": [{"type": 15, "data": "0 ."}]})")
            .empty());
  CHECK(DNS::parse_doh_reply(
            R"({"Answer": [{"type": 15, "data": "99999 too.big."}]})")
            .empty());

  CHECK(throws_connection_error([] { DNS::parse_doh_reply("<html>"); }));
  CHECK(throws_connection_error([] { DNS::parse_doh_reply("[1, 2]"); }));

  auto fetcher = std::make_shared<Fake_fetcher>();
  fetcher->rsp = HTTP::Response{200, gmail_reply, ""};

  DNS::DoH_resolver res{fetcher, "https://dns.example/resolve"};
  auto const records = res.get_mx_records("gmail.com");
  CHECK(records == mxs);
  CHECK_EQ(fetcher->last_url,
           "https://dns.example/resolve?name=gmail.com&type=MX"s);

  res.get_mx_records("xn--bcher-kva.de");
  CHECK_EQ(fetcher->last_url,
           "https://dns.example/resolve?name=xn--bcher-kva.de&type=MX"s);

  fetcher->rsp = HTTP::Response{500, "", ""};
  CHECK(throws_connection_error([&] { res.get_mx_records("gmail.com"); }));

  fetcher->rsp = HTTP::Response{400, R"({"Status": 2})", ""};
  CHECK(throws_connection_error([&] { res.get_mx_records("gmail.com"); }));

  fetcher->blow_up = true;
  CHECK(throws_connection_error([&] { res.get_mx_records("gmail.com"); }));

  std::cout << fmt::format("{}\n", mxs[0]);
}
