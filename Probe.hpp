#ifndef PROBE_DOT_HPP
#define PROBE_DOT_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include "DNS.hpp"
#include "Sock.hpp"

class Mailbox;

namespace Config {
constexpr uint16_t    smtp_port_default    = 25;
constexpr auto        smtp_timeout_default = std::chrono::milliseconds(5000);
constexpr int         smtp_retries_default = 2;
constexpr char const* helo_domain_default  = "example.com";
constexpr char const* probe_sender_default = "check@example.com";
} // namespace Config

namespace SMTP {

struct Outcome {
  bool                deliverable{false};
  std::optional<bool> catch_all; // empty when inconclusive or not checked
  int                 code{0};   // reply to RCPT TO
  std::string         message;   // reply text after the code

  bool operator==(Outcome const& rhs) const = default;
};

std::ostream& operator<<(std::ostream& os, Outcome const& outcome);

// Open a connection to host:port; throws ConnectionError on failure.
using Connector = std::function<std::unique_ptr<Sock>(
    std::string const& host, uint16_t port, std::chrono::milliseconds timeout)>;

std::unique_ptr<Sock> tcp_connect(std::string const&        host,
                                  uint16_t                  port,
                                  std::chrono::milliseconds timeout);

Connector socks5_connector(std::string proxy_host, uint16_t proxy_port);

// Asks each mail exchanger in turn, without sending mail, whether it
// would accept the address, and optionally whether it accepts any
// address at all.

class Prober {
public:
  struct Options {
    bool                      catch_all_check{true};
    int                       max_retries{Config::smtp_retries_default};
    std::chrono::milliseconds timeout{Config::smtp_timeout_default};
    uint16_t                  port{Config::smtp_port_default};
    std::string               helo_domain{Config::helo_domain_default};
    std::string               sender{Config::probe_sender_default};
  };

  explicit Prober(Options options, Connector connector = tcp_connect);

  // No exchangers gives a non-deliverable outcome without connecting.
  // Throws ConnectionError when no exchanger could be talked to.
  Outcome probe(Mailbox const& mbx, DNS::RR_MX_collection const& mxs);

private:
  Outcome session_(std::string const& exchange,
                   std::string const& rcpt,
                   std::string const& catch_all_rcpt);

  Options   options_;
  Connector connector_;
};

} // namespace SMTP

#endif // PROBE_DOT_HPP
