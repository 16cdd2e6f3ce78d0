#ifndef DATASET_DOT_HPP
#define DATASET_DOT_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

class Provider;

namespace Dataset {

// Which list decided the outcome.
enum class source : uint8_t {
  allow,
  deny,
  dflt,
};

constexpr char const* c_str(source src)
{
  switch (src) {
  case source::allow: return "ALLOW";
  case source::deny: return "DENY";
  case source::dflt: return "DEFAULT";
  }
  return "*** unknown source ***";
}

inline std::ostream& operator<<(std::ostream& os, source src)
{
  return os << c_str(src);
}

struct Data {
  bool                       match{false};
  std::optional<std::string> matched_on;
  std::optional<source>      src;

  bool operator==(Data const& rhs) const = default;
};

std::ostream& operator<<(std::ostream& os, Data const& data);

// Keys are either looked up as given (usernames), or as a host name
// and each of its parent domains down to the last two labels.
enum class key_type : bool {
  exact,
  hostname,
};

using entry_set = std::unordered_set<std::string>;

// A base list plus allow and deny lists.  Allow beats deny beats the
// base list.  The base list is reloaded from its provider and swapped
// in whole.

class Matcher {
public:
  Matcher(Matcher const&) = delete;
  Matcher& operator=(Matcher const&) = delete;

  Matcher(key_type                  type,
          std::unique_ptr<Provider> provider,
          entry_set                 allow = {},
          entry_set                 deny  = {});

  // Reload the base list; on failure the current list stays.
  void refresh();

  Data check(std::string_view key) const;

  size_t size() const;

private:
  std::vector<std::string> candidates_(std::string_view key) const;
  std::shared_ptr<entry_set const> current_() const;

  key_type                  type_;
  std::unique_ptr<Provider> provider_;
  entry_set const           allow_;
  entry_set const           deny_;

  mutable std::mutex               mtx_;
  std::shared_ptr<entry_set const> base_;
};

// The host name itself, then each parent down to two labels; nothing
// for a single label.
std::vector<std::string> hostname_candidates(std::string_view hostname);

} // namespace Dataset

#endif // DATASET_DOT_HPP
