#include "SOCKS5.hpp"

#include "Errors.hpp"
#include "POSIX.hpp"

#include <array>
#include <vector>

#include <glog/logging.h>

#include <fmt/format.h>

namespace {
using octet = uint8_t;

octet constexpr socks_version = 5;
octet constexpr reserved      = 0;

octet constexpr lo(uint16_t n) { return octet(n & 0xFF); }
octet constexpr hi(uint16_t n) { return octet((n >> 8) & 0xFF); }

enum class auth_method : octet {
  no_auth = 0,
  none    = 0xff,
};

enum class command : octet {
  connect       = 1,
  bind          = 2,
  udp_associate = 3,
};

enum class address_type : octet {
  ip4_address = 1,
  domain_name = 3,
  ip6_address = 4,
};

enum class reply_field : octet {
  succeeded,
  server_failure,
  not_allowed,
  network_unreachable,
  host_unreachable,
  connection_refused,
  TTL_expired,
  command_not_supported,
  address_type_not_supported,
};

constexpr char const* c_str(reply_field rp)
{
  switch (rp) {
  case reply_field::succeeded: return "succeeded";
  case reply_field::server_failure: return "general SOCKS server failure";
  case reply_field::not_allowed: return "connection not allowed by ruleset";
  case reply_field::network_unreachable: return "network unreachable";
  case reply_field::host_unreachable: return "host unreachable";
  case reply_field::connection_refused: return "connection refused";
  case reply_field::TTL_expired: return "TTL expired";
  case reply_field::command_not_supported: return "command not supported";
  case reply_field::address_type_not_supported:
    return "address type not supported";
  }
  return "*** unknown reply field ***";
}

void send_all(int fd, std::vector<octet> const& msg, std::chrono::milliseconds timeout)
{
  auto       t_o = false;
  auto const n   = static_cast<std::streamsize>(msg.size());
  if (POSIX::write(fd, reinterpret_cast<char const*>(msg.data()), n, timeout,
                   t_o)
      != n) {
    throw ConnectionError(t_o ? "SOCKS5 proxy write timed out"
                              : "SOCKS5 proxy write failed");
  }
}

template <size_t N>
std::array<octet, N> recv_exactly(int fd, std::chrono::milliseconds timeout)
{
  std::array<octet, N> bfr;
  auto                 got = size_t{0};
  while (got < N) {
    auto       t_o = false;
    auto const n   = POSIX::read(fd, reinterpret_cast<char*>(bfr.data()) + got,
                               static_cast<std::streamsize>(N - got), timeout,
                               t_o);
    if (n <= 0) {
      throw ConnectionError(t_o ? "SOCKS5 proxy read timed out"
                                : "SOCKS5 proxy closed connection");
    }
    got += static_cast<size_t>(n);
  }
  return bfr;
}

void skip(int fd, size_t count, std::chrono::milliseconds timeout)
{
  while (count--)
    recv_exactly<1>(fd, timeout);
}
} // namespace

namespace SOCKS5 {

void connect(int                       fd,
             std::string const&        host,
             uint16_t                  port,
             std::chrono::milliseconds timeout)
{
  if (host.empty() || (host.size() > 255)) {
    throw ConnectionError(fmt::format("can't ask proxy for host «{}»", host));
  }

  // Greeting: one method, no authentication.
  send_all(fd,
           {socks_version, 1, static_cast<octet>(auth_method::no_auth)},
           timeout);

  auto const method = recv_exactly<2>(fd, timeout);
  if (method[0] != socks_version) {
    throw ConnectionError(
        fmt::format("SOCKS5 proxy replied with version {}", method[0]));
  }
  if (static_cast<auth_method>(method[1]) != auth_method::no_auth) {
    throw ConnectionError("SOCKS5 proxy requires authentication");
  }

  std::vector<octet> request{socks_version,
                             static_cast<octet>(command::connect), reserved,
                             static_cast<octet>(address_type::domain_name),
                             static_cast<octet>(host.size())};
  request.insert(end(request), begin(host), end(host));
  request.push_back(hi(port));
  request.push_back(lo(port));
  send_all(fd, request, timeout);

  auto const reply = recv_exactly<4>(fd, timeout);
  if (reply[0] != socks_version) {
    throw ConnectionError(
        fmt::format("SOCKS5 proxy replied with version {}", reply[0]));
  }
  auto const rep = static_cast<reply_field>(reply[1]);
  if (rep != reply_field::succeeded) {
    throw ConnectionError(fmt::format("SOCKS5 proxy can't reach {}:{}: {}",
                                      host, port, c_str(rep)));
  }

  // Bound address and port, not used.
  switch (static_cast<address_type>(reply[3])) {
  case address_type::ip4_address: skip(fd, 4 + 2, timeout); break;
  case address_type::ip6_address: skip(fd, 16 + 2, timeout); break;
  case address_type::domain_name: {
    auto const len = recv_exactly<1>(fd, timeout);
    skip(fd, len[0] + 2, timeout);
    break;
  }
  default:
    throw ConnectionError(
        fmt::format("SOCKS5 proxy sent address type {}", reply[3]));
  }

  LOG(INFO) << "SOCKS5 proxy connected to " << host << ':' << port;
}

} // namespace SOCKS5
