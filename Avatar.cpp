#include "Avatar.hpp"

#include "Errors.hpp"
#include "HTTP.hpp"
#include "Hash.hpp"
#include "Mailbox.hpp"

#include <glog/logging.h>

#include <fmt/format.h>

#include <boost/algorithm/string/case_conv.hpp>

namespace {
// Some services answer with a stock image rather than a 404.
constexpr char const* placeholder_md5 = "d5fe5cbcc31cff5f8ac010db72eb000c";
} // namespace

Avatar::Avatar(std::shared_ptr<HTTP::Fetcher> fetcher, std::string base)
  : fetcher_(std::move(fetcher))
  , base_(std::move(base))
{
  while (!base_.empty() && (base_.back() == '/'))
    base_.pop_back();
}

std::string Avatar::hash(Mailbox const& mbx)
{
  return Hash::of(boost::algorithm::to_lower_copy(mbx.without_tag()));
}

Avatar::Data Avatar::lookup(Mailbox const& mbx)
{
  auto const md5 = hash(mbx);
  auto const rsp = fetcher_->get(fmt::format("{}/{}?d=404", base_, md5));

  if (rsp.status == 404)
    return Data{};
  if (rsp.status != 200) {
    throw ConnectionError(
        fmt::format("avatar lookup for {}: HTTP status {}", md5, rsp.status));
  }
  if (Hash::of(rsp.body) == placeholder_md5) {
    VLOG(1) << "placeholder image for " << md5;
    return Data{};
  }
  return Data{fmt::format("{}/{}", base_, md5)};
}

std::ostream& operator<<(std::ostream& os, Avatar::Data const& data)
{
  return os << "url=" << data.url.value_or("none");
}
