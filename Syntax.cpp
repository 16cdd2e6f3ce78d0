#include "Syntax.hpp"

#include "Mailbox.hpp"

#include <algorithm>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using namespace tao::pegtl;
using namespace tao::pegtl::abnf;

namespace {
size_t constexpr max_username_length = 64;
size_t constexpr max_hostname_length = 253;
size_t constexpr max_label_length    = 63;
} // namespace

namespace RFC5322 {
// clang-format off

using dot = one<'.'>;

// excluded from atext: "(),.@[]"
struct atext : sor<ALPHA, DIGIT,
                   one<'!', '#',
                       '$', '%',
                       '&', '\'',
                       '*', '+',
                       '-', '/',
                       '=', '?',
                       '^', '_',
                       '`', '{',
                       '|', '}',
                       '~'>> {};

struct atom : plus<atext> {};
struct dot_atom : list<atom, dot> {};

// A backslash escapes any one character; otherwise no quote,
// backslash, CR or LF.
struct quoted_pair : seq<one<'\\'>, any> {};
struct qtext : not_one<'"', '\\', '\r', '\n'> {};
struct quoted_string : seq<one<'"'>, star<sor<quoted_pair, qtext>>, one<'"'>> {};

struct username : seq<sor<quoted_string, dot_atom>, eof> {};

struct plus_tag : seq<star<sor<atext, dot>>, eof> {};

// clang-format on
} // namespace RFC5322

namespace RFC1035 {
// clang-format off

using dot = one<'.'>;
using dash = one<'-'>;

struct let_dig : sor<ALPHA, DIGIT> {};

struct ldh_tail : star<sor<seq<plus<dash>, let_dig>, let_dig>> {};

struct label : seq<let_dig, ldh_tail> {};

struct hostname : seq<list<label, dot>, eof> {};

// clang-format on

struct label_lengths {
  size_t longest{0};
};

template <typename Rule>
struct action : nothing<Rule> {
};

template <>
struct action<label> {
  template <typename Input>
  static void apply(Input const& in, label_lengths& lens)
  {
    lens.longest = std::max(lens.longest, in.size());
  }
};
} // namespace RFC1035

namespace Syntax {

std::ostream& operator<<(std::ostream& os, Data const& data)
{
  return os << "username=" << std::boolalpha << data.username
            << " plus_tag=" << data.plus_tag << " hostname=" << data.hostname
            << std::noboolalpha;
}

bool is_username_valid(std::string_view username)
{
  if (username.empty() || (username.length() > max_username_length))
    return false;
  memory_input<> in(username.data(), username.size(), "username");
  return parse<RFC5322::username>(in);
}

bool is_plus_tag_valid(std::string_view plus_tag)
{
  memory_input<> in(plus_tag.data(), plus_tag.size(), "plus_tag");
  return parse<RFC5322::plus_tag>(in);
}

bool is_hostname_valid(std::string_view hostname)
{
  if (hostname.empty() || (hostname.length() > max_hostname_length))
    return false;
  RFC1035::label_lengths lens;
  memory_input<>         in(hostname.data(), hostname.size(), "hostname");
  return parse<RFC1035::hostname, RFC1035::action>(in, lens)
         && (lens.longest <= max_label_length);
}

Data check(Mailbox const& mbx)
{
  return Data{
      .username = is_username_valid(mbx.username()),
      .plus_tag = is_plus_tag_valid(mbx.plus_tag()),
      .hostname = is_hostname_valid(mbx.hostname()),
  };
}

} // namespace Syntax
