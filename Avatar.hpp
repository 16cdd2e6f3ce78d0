#ifndef AVATAR_DOT_HPP
#define AVATAR_DOT_HPP

#include <memory>
#include <optional>
#include <ostream>
#include <string>

namespace HTTP {
class Fetcher;
}

class Mailbox;

namespace Config {
constexpr char const* avatar_endpoint_default
    = "https://www.gravatar.com/avatar";
} // namespace Config

// Looks up a profile image for an address on a Gravatar style
// service, keyed by the MD5 of the lower cased username@hostname.

class Avatar {
public:
  struct Data {
    std::optional<std::string> url;

    bool operator==(Data const& rhs) const = default;
  };

  explicit Avatar(std::shared_ptr<HTTP::Fetcher> fetcher,
                  std::string base = Config::avatar_endpoint_default);

  // Present only for a 200 that isn't the placeholder image; absent
  // for a 404.  Throws ConnectionError on transport failure or any
  // other status.
  Data lookup(Mailbox const& mbx);

  static std::string hash(Mailbox const& mbx);

private:
  std::shared_ptr<HTTP::Fetcher> fetcher_;
  std::string                    base_;
};

std::ostream& operator<<(std::ostream& os, Avatar::Data const& data);

#endif // AVATAR_DOT_HPP
