#include "Probe.hpp"

#include "Errors.hpp"
#include "Mailbox.hpp"

#include <algorithm>
#include <iostream>
#include <thread>
#include <vector>

#include <sys/socket.h>
#include <unistd.h>

#include <glog/logging.h>

#include <boost/algorithm/string/predicate.hpp>

using namespace std::string_literals;
using std::chrono::milliseconds;

namespace {
// The far end of a connection: sends the first reply as a greeting,
// then one reply per command line received, then hangs up.
class Scripted_peer {
public:
  explicit Scripted_peer(std::vector<std::string> replies)
    : replies_(std::move(replies))
  {
    PCHECK(socketpair(AF_UNIX, SOCK_STREAM, 0, fds_) == 0);
    thread_ = std::thread([this] { serve_(); });
  }

  ~Scripted_peer()
  {
    if (thread_.joinable())
      thread_.join();
  }

  std::unique_ptr<Sock> client(milliseconds timeout)
  {
    return std::make_unique<Sock>(fds_[0], timeout, timeout);
  }

  std::vector<std::string> const& commands()
  {
    thread_.join();
    return commands_;
  }

private:
  void send_(std::string const& reply)
  {
    ::send(fds_[1], reply.data(), reply.size(), MSG_NOSIGNAL);
  }

  bool read_line_(std::string& line)
  {
    line.clear();
    char ch;
    while (::read(fds_[1], &ch, 1) == 1) {
      line += ch;
      if (boost::ends_with(line, "\r\n")) {
        line.resize(line.size() - 2);
        return true;
      }
    }
    return false;
  }

  void serve_()
  {
    auto it = begin(replies_);
    if (it != end(replies_))
      send_(*it++);
    std::string line;
    while ((it != end(replies_)) && read_line_(line)) {
      commands_.push_back(line);
      send_(*it++);
    }
    close(fds_[1]);
  }

  std::vector<std::string> replies_;
  std::vector<std::string> commands_;
  int                      fds_[2];
  std::thread              thread_;
};

// Hands out one scripted peer per connection, in order, and records
// the hosts asked for.
struct Switchboard {
  std::vector<std::unique_ptr<Scripted_peer>> peers;
  std::vector<std::string>                    hosts;
  std::vector<std::string>                    unreachable;
  size_t                                      next{0};

  SMTP::Connector connector()
  {
    return [this](std::string const& host, uint16_t port,
                  milliseconds timeout) -> std::unique_ptr<Sock> {
      CHECK_EQ(port, 25);
      hosts.push_back(host);
      if (std::find(begin(unreachable), end(unreachable), host)
          != end(unreachable)) {
        throw ConnectionError("can't connect to " + host);
      }
      CHECK_LT(next, peers.size()) << "unexpected connection to " << host;
      return peers[next++]->client(timeout);
    };
  }

  void expect(std::vector<std::string> replies)
  {
    peers.push_back(std::make_unique<Scripted_peer>(std::move(replies)));
  }
};

SMTP::Prober::Options fast_options()
{
  SMTP::Prober::Options options;
  options.timeout = milliseconds(500);
  return options;
}

auto const mbx = Mailbox{"user", "tag", "example.com"};
auto const mxs = DNS::RR_MX_collection{{"mx1.example.com", 10},
                                       {"mx2.example.com", 20}};
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  {
    Switchboard sb;
    sb.expect({"220 mx1.example.com ESMTP\r\n", "250 mx1.example.com\r\n",
               "250 2.1.0 Ok\r\n", "250 OK, user exists\r\n",
               "550 5.1.1 no such user\r\n", "221 Bye\r\n"});

    SMTP::Prober prober{fast_options(), sb.connector()};
    auto const   outcome = prober.probe(mbx, mxs);

    CHECK(outcome.deliverable);
    CHECK_EQ(outcome.code, 250);
    CHECK_EQ(outcome.message, "OK, user exists"s);
    CHECK(outcome.catch_all.has_value());
    CHECK(!*outcome.catch_all);

    CHECK_EQ(sb.hosts.size(), 1U);
    CHECK_EQ(sb.hosts[0], "mx1.example.com"s);

    auto const& cmds = sb.peers[0]->commands();
    CHECK_EQ(cmds.size(), 5U);
    CHECK_EQ(cmds[0], "HELO example.com"s);
    CHECK_EQ(cmds[1], "MAIL FROM:<check@example.com>"s);
    CHECK_EQ(cmds[2], "RCPT TO:<user@example.com>"s); // no plus-tag
    CHECK(boost::starts_with(cmds[3], "RCPT TO:<"));
    CHECK(boost::ends_with(cmds[3], "@example.com>"));
    CHECK_NE(cmds[3], cmds[2]);
    CHECK_EQ(cmds[4], "QUIT"s);
  }

  {
    // Rejected, multi-line replies, catch-all accepted.
    Switchboard sb;
    sb.expect({"220-mx1.example.com ESMTP\r\n220 welcome\r\n",
               "250-mx1.example.com\r\n250 HELP\r\n", "250 Ok\r\n",
               "550 5.1.1 <user@example.com>: Recipient address rejected\r\n",
               "250 Ok\r\n", "221 Bye\r\n"});

    SMTP::Prober prober{fast_options(), sb.connector()};
    auto const   outcome = prober.probe(mbx, mxs);

    CHECK(!outcome.deliverable);
    CHECK_EQ(outcome.code, 550);
    CHECK_EQ(outcome.message,
             "5.1.1 <user@example.com>: Recipient address rejected"s);
    CHECK(outcome.catch_all.has_value());
    CHECK(*outcome.catch_all);
  }

  {
    // Inconclusive catch-all reply.
    Switchboard sb;
    sb.expect({"220 hi\r\n", "250 hi\r\n", "250 ok\r\n", "250 ok\r\n",
               "451 try later\r\n", "221 bye\r\n"});

    SMTP::Prober prober{fast_options(), sb.connector()};
    auto const   outcome = prober.probe(mbx, mxs);
    CHECK(outcome.deliverable);
    CHECK(!outcome.catch_all.has_value());
  }

  {
    // No catch-all probe, and a server that drops us at QUIT.
    Switchboard sb;
    sb.expect({"220 hi\r\n", "250 hi\r\n", "250 ok\r\n", "250 ok\r\n"});

    auto options            = fast_options();
    options.catch_all_check = false;
    options.helo_domain     = "probe.example.net";
    options.sender          = "bounce@example.net";

    SMTP::Prober prober{options, sb.connector()};
    auto const   outcome = prober.probe(mbx, mxs);
    CHECK(outcome.deliverable);
    CHECK(!outcome.catch_all.has_value());

    auto const& cmds = sb.peers[0]->commands();
    CHECK_EQ(cmds[0], "HELO probe.example.net"s);
    CHECK_EQ(cmds[1], "MAIL FROM:<bounce@example.net>"s);
    CHECK_EQ(cmds.size(), 3U); // hung up before QUIT
    CHECK_EQ(cmds[2], "RCPT TO:<user@example.com>"s);
  }

  {
    // First host unreachable, second host answers.
    Switchboard sb;
    sb.unreachable.push_back("mx1.example.com");
    sb.expect({"220 mx2\r\n", "250 mx2\r\n", "250 ok\r\n", "250 ok\r\n",
               "550 no\r\n", "221 bye\r\n"});

    SMTP::Prober prober{fast_options(), sb.connector()};
    auto const   outcome = prober.probe(mbx, mxs);
    CHECK(outcome.deliverable);
    CHECK_EQ(outcome.code, 250);

    // Two tries at mx1, then mx2.
    CHECK((sb.hosts
           == std::vector<std::string>{"mx1.example.com", "mx1.example.com",
                                       "mx2.example.com"}));
  }

  {
    // A bad greeting counts as a failed attempt and is retried.
    Switchboard sb;
    sb.expect({"554 go away\r\n"});
    sb.expect({"220 ok now\r\n", "250 hi\r\n", "250 ok\r\n",
               "550 unknown\r\n", "550 unknown\r\n", "221 bye\r\n"});

    SMTP::Prober prober{fast_options(), sb.connector()};
    auto const   outcome = prober.probe(mbx, mxs);
    CHECK(!outcome.deliverable);
    CHECK_EQ(outcome.code, 550);
    CHECK((sb.hosts
           == std::vector<std::string>{"mx1.example.com", "mx1.example.com"}));
  }

  {
    // Garbage and silence are failed attempts too.
    Switchboard sb;
    sb.expect({"HTTP/1.1 400 Bad Request\r\n"});
    sb.expect({});
    sb.expect({"220 hi\r\n", "250 hi\r\n", "250 ok\r\n", "250 ok\r\n",
               "550 no\r\n", "221 bye\r\n"});

    SMTP::Prober prober{fast_options(), sb.connector()};
    auto const   outcome = prober.probe(mbx, mxs);
    CHECK(outcome.deliverable);
    CHECK_EQ(sb.hosts.size(), 3U);
    CHECK_EQ(sb.hosts[2], "mx2.example.com"s);
  }

  {
    // Every attempt fails.
    Switchboard sb;
    sb.unreachable = {"mx1.example.com", "mx2.example.com"};

    auto options        = fast_options();
    options.max_retries = 3;

    SMTP::Prober prober{options, sb.connector()};
    auto         threw = false;
    try {
      prober.probe(mbx, mxs);
    }
    catch (ConnectionError const& e) {
      LOG(INFO) << "expected: " << e.what();
      threw = true;
    }
    CHECK(threw);
    CHECK_EQ(sb.hosts.size(), 6U);
  }

  {
    // No exchangers, no connections.
    Switchboard  sb;
    SMTP::Prober prober{fast_options(), sb.connector()};
    auto const   outcome = prober.probe(mbx, {});
    CHECK(outcome == SMTP::Outcome{});
    CHECK(!outcome.deliverable);
    CHECK(!outcome.catch_all.has_value());
    CHECK_EQ(outcome.code, 0);
    CHECK(outcome.message.empty());
    CHECK(sb.hosts.empty());
  }

  std::cout << SMTP::Outcome{true, false, 250, "OK"} << '\n';
}
