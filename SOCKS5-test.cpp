#include "SOCKS5.hpp"

#include "Errors.hpp"
#include "POSIX.hpp"

#include <thread>
#include <vector>

#include <sys/socket.h>
#include <unistd.h>

#include <glog/logging.h>

using namespace std::string_literals;
using octets = std::vector<uint8_t>;

namespace {
octets read_n(int fd, size_t n)
{
  octets bfr(n);
  size_t got = 0;
  while (got < n) {
    auto const r = ::read(fd, bfr.data() + got, n - got);
    PCHECK(r > 0) << "proxy read";
    got += r;
  }
  return bfr;
}

void write_all(int fd, octets const& msg)
{
  PCHECK(::send(fd, msg.data(), msg.size(), MSG_NOSIGNAL)
         == static_cast<ssize_t>(msg.size()));
}

// Plays the proxy side: checks the greeting and request, answers with
// the given method choice and reply.
void proxy(int           fd,
           uint8_t       method,
           octets const& reply,
           std::string   expect_host,
           uint16_t      expect_port)
{
  CHECK((read_n(fd, 3) == octets{5, 1, 0}));
  write_all(fd, {5, method});
  if (method != 0)
    return;

  auto const head = read_n(fd, 5);
  CHECK((head == octets{5, 1, 0, 3, uint8_t(expect_host.size())}));
  auto const host = read_n(fd, expect_host.size());
  CHECK_EQ(std::string(begin(host), end(host)), expect_host);
  auto const port = read_n(fd, 2);
  CHECK_EQ((port[0] << 8) | port[1], expect_port);

  write_all(fd, reply);
}

bool connect_throws(uint8_t method, octets reply)
{
  int fds[2];
  PCHECK(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
  CHECK(POSIX::set_nonblocking(fds[0]));

  std::thread server{
      [&] { proxy(fds[1], method, reply, "mx.example.com", 25); }};

  auto threw = false;
  try {
    SOCKS5::connect(fds[0], "mx.example.com", 25,
                    std::chrono::milliseconds(500));
  }
  catch (ConnectionError const& e) {
    LOG(INFO) << "expected: " << e.what();
    threw = true;
  }

  server.join();
  close(fds[0]);
  close(fds[1]);
  return threw;
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  // IPv4 bound address.
  CHECK(!connect_throws(0, {5, 0, 0, 1, 10, 0, 0, 1, 0x04, 0x38}));

  // IPv6 bound address.
  auto v6 = octets{5, 0, 0, 4};
  v6.resize(4 + 16 + 2, 0);
  CHECK(!connect_throws(0, v6));

  // Domain name bound address.
  CHECK(!connect_throws(0, {5, 0, 0, 3, 3, 'a', '.', 'b', 0, 25}));

  // Connection refused.
  CHECK(connect_throws(0, {5, 5, 0, 1, 0, 0, 0, 0, 0, 0}));

  // Wants a password.
  CHECK(connect_throws(0xff, {}));

  // Wrong version in the reply.
  CHECK(connect_throws(0, {4, 0, 0, 1, 0, 0, 0, 0, 0, 0}));

  // Proxy hangs up early.
  CHECK(connect_throws(0, {5, 0}));

  // Not a name we can send.
  auto threw = false;
  try {
    SOCKS5::connect(-1, std::string(256, 'x'), 25, std::chrono::seconds(1));
  }
  catch (ConnectionError const& e) {
    threw = true;
  }
  CHECK(threw);
}
