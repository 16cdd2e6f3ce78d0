#include "Dataset.hpp"

#include "Provider.hpp"

#include <algorithm>

#include <glog/logging.h>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/split.hpp>

namespace Dataset {

std::ostream& operator<<(std::ostream& os, Data const& data)
{
  os << "match=" << std::boolalpha << data.match << std::noboolalpha;
  if (data.matched_on)
    os << " matched_on=" << *data.matched_on;
  if (data.src)
    os << " source=" << *data.src;
  return os;
}

std::vector<std::string> hostname_candidates(std::string_view hostname)
{
  std::vector<std::string> labels;
  boost::algorithm::split(labels, std::string(hostname),
                          boost::algorithm::is_any_of("."));

  std::vector<std::string> candidates;
  for (size_t i = 0; i + 1 < labels.size(); ++i) {
    std::vector<std::string> tail(labels.begin() + i, labels.end());
    candidates.push_back(boost::algorithm::join(tail, "."));
  }
  return candidates;
}

Matcher::Matcher(key_type                  type,
                 std::unique_ptr<Provider> provider,
                 entry_set                 allow,
                 entry_set                 deny)
  : type_(type)
  , provider_(std::move(provider))
  , allow_(std::move(allow))
  , deny_(std::move(deny))
  , base_(std::make_shared<entry_set const>())
{
  refresh();
}

void Matcher::refresh()
{
  auto const entries = CHECK_NOTNULL(provider_.get())->provide();
  auto base = std::make_shared<entry_set const>(begin(entries), end(entries));

  std::lock_guard<std::mutex> lock(mtx_);
  base_ = std::move(base);
}

std::shared_ptr<entry_set const> Matcher::current_() const
{
  std::lock_guard<std::mutex> lock(mtx_);
  return base_;
}

size_t Matcher::size() const { return current_()->size(); }

std::vector<std::string> Matcher::candidates_(std::string_view key) const
{
  if (type_ == key_type::hostname)
    return hostname_candidates(key);
  return {std::string(key)};
}

Data Matcher::check(std::string_view key) const
{
  auto const candidates = candidates_(key);

  auto const first_in = [&candidates](entry_set const& set) {
    return std::find_if(begin(candidates), end(candidates),
                        [&set](auto const& c) { return set.contains(c); });
  };

  if (auto const allowed = first_in(allow_); allowed != end(candidates)) {
    VLOG(2) << *allowed << " is in the allow list";
    return Data{false, *allowed, source::allow};
  }

  if (auto const denied = first_in(deny_); denied != end(candidates)) {
    VLOG(2) << *denied << " is in the deny list";
    return Data{true, *denied, source::deny};
  }

  auto const base = current_();
  if (auto const hit = first_in(*base); hit != end(candidates)) {
    VLOG(2) << *hit << " is in the list";
    return Data{true, *hit, source::dflt};
  }

  return Data{};
}

} // namespace Dataset
