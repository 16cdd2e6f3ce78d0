#ifndef SYNTAX_DOT_HPP
#define SYNTAX_DOT_HPP

#include <ostream>
#include <string_view>

class Mailbox;

namespace Syntax {

struct Data {
  bool username{false};
  bool plus_tag{false};
  bool hostname{false};

  bool all() const { return username && plus_tag && hostname; }

  bool operator==(Data const& rhs) const = default;
};

std::ostream& operator<<(std::ostream& os, Data const& data);

// 1 to 64 octets, either a quoted-string or a dot-atom.
bool is_username_valid(std::string_view username);

// Empty, or atext and '.' only.
bool is_plus_tag_valid(std::string_view plus_tag);

// At most 253 octets of LDH labels, each 1 to 63 octets.
bool is_hostname_valid(std::string_view hostname);

Data check(Mailbox const& mbx);

} // namespace Syntax

#endif // SYNTAX_DOT_HPP
