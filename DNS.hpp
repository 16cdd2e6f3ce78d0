#ifndef DNS_DOT_HPP
#define DNS_DOT_HPP

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace HTTP {
class Fetcher;
}

namespace Config {
constexpr char const* doh_endpoint_default = "https://dns.google/resolve";
} // namespace Config

namespace DNS {

class RR_MX {
public:
  RR_MX(std::string exchange, uint16_t preference)
    : exchange_(std::move(exchange))
    , preference_(preference)
  {
  }

  std::string const& exchange() const { return exchange_; }
  uint16_t           preference() const { return preference_; }

  bool operator==(RR_MX const& rhs) const
  {
    return (preference() == rhs.preference()) && (exchange() == rhs.exchange());
  }

private:
  std::string exchange_;
  uint16_t    preference_;
};

inline std::ostream& operator<<(std::ostream& os, RR_MX const& mx)
{
  return os << mx.preference() << ' ' << mx.exchange();
}

using RR_MX_collection = std::vector<RR_MX>;

// Mail exchangers for a host name, most preferred (lowest preference
// value) first.  An empty list is an answer, not an error; failure to
// get an answer throws ConnectionError.
class MX_resolver {
public:
  virtual ~MX_resolver() = default;

  virtual RR_MX_collection get_mx_records(std::string const& hostname) = 0;
};

// Queries a DNS-over-HTTPS JSON endpoint: GET {base}?name=…&type=MX
class DoH_resolver : public MX_resolver {
public:
  DoH_resolver(std::shared_ptr<HTTP::Fetcher> fetcher,
               std::string                    endpoint
               = Config::doh_endpoint_default);

  RR_MX_collection get_mx_records(std::string const& hostname) override;

private:
  std::shared_ptr<HTTP::Fetcher> fetcher_;
  std::string                    endpoint_;
};

// Parse the JSON body of a DoH reply, keeping type 15 answers whose
// data is "<preference> <exchange>."; bad entries are logged and
// skipped.  Throws ConnectionError if the body isn't JSON.
RR_MX_collection parse_doh_reply(std::string_view json);

void sort_by_preference(RR_MX_collection& mxs);

} // namespace DNS

#endif // DNS_DOT_HPP
