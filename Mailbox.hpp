#ifndef MAILBOX_DOT_HPP
#define MAILBOX_DOT_HPP

#include <ostream>
#include <string>
#include <string_view>
#include <utility>

// An address split into its logical parts: the local part up to the
// first '+' is the username, the rest is the plus-tag, and the host
// name is in ASCII compatible encoding.  Immutable once parsed.

class Mailbox {
public:
  Mailbox() = default;

  Mailbox(std::string username, std::string plus_tag, std::string hostname)
    : username_(std::move(username))
    , plus_tag_(std::move(plus_tag))
    , hostname_(std::move(hostname))
  {
  }

  // Requires exactly one '@', throws FormatError otherwise.
  static Mailbox parse(std::string_view address);

  static bool
  validate(std::string_view address, std::string& msg, Mailbox& mbx);

  std::string const& username() const { return username_; }
  std::string const& plus_tag() const { return plus_tag_; }
  std::string const& hostname() const { return hostname_; }

  bool empty() const
  {
    return username_.empty() && plus_tag_.empty() && hostname_.empty();
  }

  // username+tag@hostname
  std::string as_string() const;

  // username@hostname
  std::string without_tag() const;

  bool operator==(Mailbox const& rhs) const = default;

private:
  std::string username_;
  std::string plus_tag_;
  std::string hostname_;
};

inline std::ostream& operator<<(std::ostream& s, Mailbox const& mbx)
{
  return s << mbx.as_string();
}

#endif // MAILBOX_DOT_HPP
