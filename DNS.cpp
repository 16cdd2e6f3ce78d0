#include "DNS.hpp"

#include "Errors.hpp"
#include "HTTP.hpp"

#include <algorithm>
#include <charconv>
#include <optional>

#include <glog/logging.h>

#include <fmt/format.h>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace {
int constexpr rr_type_mx = 15;

std::optional<DNS::RR_MX> parse_mx_data(std::string const& data)
{
  std::vector<std::string> parts;
  boost::algorithm::split(parts, data, boost::algorithm::is_any_of(" "),
                          boost::algorithm::token_compress_on);
  if (parts.size() != 2)
    return {};

  uint16_t   preference{0};
  auto const& pref = parts[0];
  auto [ptr, ec]
      = std::from_chars(pref.data(), pref.data() + pref.size(), preference);
  if ((ec != std::errc{}) || (ptr != pref.data() + pref.size()))
    return {};

  auto exchange = parts[1];
  if (!exchange.empty() && (exchange.back() == '.'))
    exchange.pop_back();
  if (exchange.empty()) // RFC 7505 null MX, or junk
    return {};

  return DNS::RR_MX{exchange, preference};
}
} // namespace

namespace DNS {

void sort_by_preference(RR_MX_collection& mxs)
{
  std::stable_sort(begin(mxs), end(mxs), [](auto const& a, auto const& b) {
    return a.preference() < b.preference();
  });
}

RR_MX_collection parse_doh_reply(std::string_view body)
{
  json reply;
  try {
    reply = json::parse(body);
  }
  catch (json::parse_error const& e) {
    throw ConnectionError(fmt::format("bad DoH reply: {}", e.what()));
  }

  RR_MX_collection mxs;

  if (!reply.is_object())
    throw ConnectionError("bad DoH reply: not an object");

  auto const answer = reply.find("Answer");
  if ((answer == reply.end()) || !answer->is_array())
    return mxs;

  for (auto const& rr : *answer) {
    if (!rr.is_object())
      continue;
    auto const type = rr.find("type");
    if ((type == rr.end()) || !type->is_number_integer()
        || (type->get<int>() != rr_type_mx))
      continue;

    auto const data = rr.find("data");
    if ((data == rr.end()) || !data->is_string()) {
      LOG(WARNING) << "MX answer without data: " << rr.dump();
      continue;
    }
    auto mx = parse_mx_data(data->get<std::string>());
    if (!mx) {
      LOG(WARNING) << "invalid MX data «" << data->get<std::string>() << "»";
      continue;
    }
    mxs.push_back(*mx);
  }

  sort_by_preference(mxs);
  return mxs;
}

DoH_resolver::DoH_resolver(std::shared_ptr<HTTP::Fetcher> fetcher,
                           std::string                    endpoint)
  : fetcher_(std::move(fetcher))
  , endpoint_(std::move(endpoint))
{
}

RR_MX_collection DoH_resolver::get_mx_records(std::string const& hostname)
{
  auto const url = fmt::format("{}?name={}&type=MX", endpoint_,
                               HTTP::encode_component(hostname));

  HTTP::Response rsp;
  try {
    rsp = fetcher_->get(url);
  }
  catch (ConnectionError const&) {
    throw;
  }
  catch (std::exception const& e) {
    throw ConnectionError(fmt::format("DoH query for {}: {}", hostname, e.what()));
  }

  if (rsp.status >= 400) {
    throw ConnectionError(fmt::format("DoH query for {} returned HTTP status {}",
                                      hostname, rsp.status));
  }

  auto mxs = parse_doh_reply(rsp.body);

  LOG(INFO) << "MXs for " << hostname << " are:";
  for (auto const& mx : mxs) {
    LOG(INFO) << fmt::format("{:3} {}", mx.preference(), mx.exchange());
  }

  return mxs;
}

} // namespace DNS
