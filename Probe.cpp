#include "Probe.hpp"

#include "Errors.hpp"
#include "Mailbox.hpp"
#include "POSIX.hpp"
#include "Pill.hpp"
#include "SOCKS5.hpp"
#include "imemstream.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <glog/logging.h>

#include <gflags/gflags.h>

// This needs to be at least the length of each reply it's trying to match.
DEFINE_uint64(pbfr_size, 4 * 1024, "parser buffer size");

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using namespace tao::pegtl;
using namespace tao::pegtl::abnf;

namespace SMTP {

struct Connection {
  explicit Connection(std::unique_ptr<Sock> s)
    : sock(std::move(s))
  {
  }

  std::unique_ptr<Sock> sock;

  std::string reply_code;
  std::string reply_text;
};

// clang-format off

namespace chars {
struct tail : range<'\x80', '\xBF'> {};

struct ch_2 : seq<range<'\xC2', '\xDF'>, tail> {};

struct ch_3 : sor<seq<one<'\xE0'>, range<'\xA0', '\xBF'>, tail>,
                  seq<range<'\xE1', '\xEC'>, rep<2, tail>>,
                  seq<one<'\xED'>, range<'\x80', '\x9F'>, tail>,
                  seq<range<'\xEE', '\xEF'>, rep<2, tail>>> {};

struct ch_4 : sor<seq<one<'\xF0'>, range<'\x90', '\xBF'>, rep<2, tail>>,
                  seq<range<'\xF1', '\xF3'>, rep<3, tail>>,
                  seq<one<'\xF4'>, range<'\x80', '\x8F'>, rep<2, tail>>> {};

struct non_ascii : sor<ch_2, ch_3, ch_4> {};
} // namespace chars

// Although not explicit in the grammar of RFC-6531, in practice UTF-8
// is used in the replys.

struct textstring : plus<sor<one<9>, range<32, 126>, chars::non_ascii>> {};

// Some servers end lines with a bare LF.
struct eol_ : seq<opt<CR>, LF> {};

// Reply-code     = %x32-35 %x30-35 %x30-39

struct reply_code
: seq<range<0x32, 0x35>, range<0x30, 0x35>, range<0x30, 0x39>> {};

struct reply_text : textstring {};

// Reply-line     = *( Reply-code "-" [ textstring ] CRLF )
//                     Reply-code  [ SP textstring ] CRLF

struct reply_lines
: seq<star<seq<reply_code, one<'-'>, opt<reply_text>, eol_>>,
           seq<reply_code, opt<seq<SP, opt<reply_text>>>, eol_>> {};

// clang-format on

template <typename Rule>
struct action : nothing<Rule> {
};

template <>
struct action<reply_code> {
  template <typename Input>
  static void apply(Input const& in, Connection& conn)
  {
    conn.reply_code = in.string();
    conn.reply_text.clear();
  }
};

template <>
struct action<reply_text> {
  template <typename Input>
  static void apply(Input const& in, Connection& conn)
  {
    conn.reply_text = in.string();
  }
};

template <>
struct action<reply_lines> {
  template <typename Input>
  static void apply(Input const& in, Connection& conn)
  {
    imemstream  stream{std::string_view(in.begin(), in.size())};
    std::string line;
    while (std::getline(stream, line)) {
      if (!line.empty() && (line.back() == '\r'))
        line.pop_back();
      LOG(INFO) << "S: " << line;
    }
  }
};

} // namespace SMTP

namespace {
int reply_code(SMTP::Connection const& conn)
{
  return std::stoi(conn.reply_code);
}

bool is_positive(SMTP::Connection const& conn)
{
  return conn.reply_code.at(0) == '2';
}

void read_reply(SMTP::Connection& conn, char const* what)
{
  auto in{istream_input<eol::crlf, 1>{conn.sock->in(), FLAGS_pbfr_size, what}};
  try {
    if (!parse<SMTP::reply_lines, SMTP::action>(in, conn)) {
      throw ConnectionError(
          fmt::format("{} reply missing or unparseable{}", what,
                      conn.sock->timed_out() ? " (timed out)" : ""));
    }
  }
  catch (ConnectionError const&) {
    throw;
  }
  catch (std::runtime_error const& e) {
    throw ConnectionError(fmt::format("{} reply: {}", what, e.what()));
  }
}

void send_command(SMTP::Connection& conn, std::string const& cmd)
{
  LOG(INFO) << "C: " << cmd;
  conn.sock->out() << cmd << "\r\n" << std::flush;
  if (!conn.sock->out()) {
    throw ConnectionError(fmt::format("failed to send «{}»", cmd));
  }
}

// A single command and its reply.
void command(SMTP::Connection& conn, std::string const& cmd, char const* what)
{
  send_command(conn, cmd);
  read_reply(conn, what);
}

struct addrinfo_deleter {
  void operator()(addrinfo* ai) const { freeaddrinfo(ai); }
};

int connect_fd(std::string const&        host,
               uint16_t                  port,
               std::chrono::milliseconds timeout)
{
  auto hints{addrinfo{}};
  hints.ai_family   = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo*  res  = nullptr;
  auto const serv = std::to_string(port);
  if (auto const rc = getaddrinfo(host.c_str(), serv.c_str(), &hints, &res);
      rc != 0) {
    throw ConnectionError(
        fmt::format("can't resolve {}: {}", host, gai_strerror(rc)));
  }
  std::unique_ptr<addrinfo, addrinfo_deleter> addrs{res};

  std::string last_error{"no addresses"};
  for (auto ai = addrs.get(); ai; ai = ai->ai_next) {
    int const fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd == -1) {
      last_error = std::strerror(errno);
      continue;
    }
    if (POSIX::connect(fd, ai->ai_addr, ai->ai_addrlen, timeout)) {
      return fd;
    }
    last_error = std::strerror(errno);
    PLOG(WARNING) << "connect to " << host << ':' << port << " failed";
    close(fd);
  }

  throw ConnectionError(
      fmt::format("can't connect to {}:{}: {}", host, port, last_error));
}
} // namespace

namespace SMTP {

std::ostream& operator<<(std::ostream& os, Outcome const& outcome)
{
  os << "deliverable=" << std::boolalpha << outcome.deliverable
     << " catch_all=";
  if (outcome.catch_all)
    os << *outcome.catch_all;
  else
    os << "unknown";
  return os << std::noboolalpha << " code=" << outcome.code << " message=«"
            << outcome.message << "»";
}

std::unique_ptr<Sock> tcp_connect(std::string const&        host,
                                  uint16_t                  port,
                                  std::chrono::milliseconds timeout)
{
  return std::make_unique<Sock>(connect_fd(host, port, timeout), timeout,
                                timeout);
}

Connector socks5_connector(std::string proxy_host, uint16_t proxy_port)
{
  return [proxy_host, proxy_port](std::string const&        host,
                                  uint16_t                  port,
                                  std::chrono::milliseconds timeout) {
    auto sock = std::make_unique<Sock>(
        connect_fd(proxy_host, proxy_port, timeout), timeout, timeout);
    SOCKS5::connect(sock->fd(), host, port, timeout);
    return sock;
  };
}

Prober::Prober(Options options, Connector connector)
  : options_(std::move(options))
  , connector_(std::move(connector))
{
}

Outcome Prober::session_(std::string const& exchange,
                         std::string const& rcpt,
                         std::string const& catch_all_rcpt)
{
  Connection conn{connector_(exchange, options_.port, options_.timeout)};

  read_reply(conn, "greeting");
  if (conn.reply_code != "220") {
    throw ConnectionError(fmt::format("{} greeted with {}", exchange,
                                      conn.reply_code));
  }

  command(conn, fmt::format("HELO {}", options_.helo_domain), "HELO");
  if (!is_positive(conn)) {
    LOG(WARNING) << "HELO: negative reply " << conn.reply_code;
  }

  command(conn, fmt::format("MAIL FROM:<{}>", options_.sender), "MAIL FROM");
  if (!is_positive(conn)) {
    LOG(WARNING) << "MAIL FROM: negative reply " << conn.reply_code;
  }

  command(conn, fmt::format("RCPT TO:<{}>", rcpt), "RCPT TO");

  Outcome outcome;
  outcome.deliverable = is_positive(conn);
  outcome.code        = reply_code(conn);
  outcome.message     = conn.reply_text;

  if (options_.catch_all_check) {
    command(conn, fmt::format("RCPT TO:<{}>", catch_all_rcpt), "RCPT TO");
    switch (conn.reply_code.at(0)) {
    case '2': outcome.catch_all = true; break;
    case '5': outcome.catch_all = false; break;
    default: break; // inconclusive
    }
  }

  try {
    command(conn, "QUIT", "QUIT");
  }
  catch (ConnectionError const& e) {
    LOG(INFO) << exchange << " dropped at QUIT: " << e.what();
  }
  conn.sock->log_totals();

  return outcome;
}

Outcome Prober::probe(Mailbox const& mbx, DNS::RR_MX_collection const& mxs)
{
  if (mxs.empty()) {
    LOG(INFO) << "no mail exchangers for " << mbx.hostname();
    return Outcome{};
  }

  auto const rcpt = mbx.without_tag();
  auto const catch_all_rcpt
      = fmt::format("{}@{}", Pill{}.as_string_view(), mbx.hostname());
  auto const attempts = std::max(options_.max_retries, 1);

  std::string last_error;
  for (auto const& mx : mxs) {
    for (auto attempt = 1; attempt <= attempts; ++attempt) {
      try {
        auto outcome = session_(mx.exchange(), rcpt, catch_all_rcpt);
        LOG(INFO) << rcpt << " via " << mx.exchange() << ": " << outcome;
        return outcome;
      }
      catch (ConnectionError const& e) {
        LOG(WARNING) << mx.exchange() << " attempt " << attempt << " of "
                     << attempts << ": " << e.what();
        last_error = e.what();
      }
    }
  }

  throw ConnectionError(fmt::format("no mail exchanger for {} could be probed: {}",
                                    mbx.hostname(), last_error));
}

} // namespace SMTP
