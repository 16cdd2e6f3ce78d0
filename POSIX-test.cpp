#include "POSIX.hpp"

#include <cstring>

#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <glog/logging.h>

using std::chrono::milliseconds;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  int fds[2];
  PCHECK(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);

  CHECK(POSIX::set_nonblocking(fds[0]));
  CHECK(POSIX::set_nonblocking(fds[0])); // twice is fine

  CHECK(!POSIX::input_ready(fds[0], milliseconds(1)));
  CHECK(POSIX::output_ready(fds[0], milliseconds(1)));

  auto t_o = false;
  char bfr[64];

  // Nothing to read.
  CHECK_EQ(POSIX::read(fds[0], bfr, sizeof(bfr), milliseconds(10), t_o), -1);
  CHECK(t_o);

  t_o = false;
  CHECK_EQ(POSIX::write(fds[0], "ping", 4, milliseconds(100), t_o), 4);
  CHECK(!t_o);
  CHECK_EQ(::read(fds[1], bfr, sizeof(bfr)), 4);
  CHECK_EQ(std::memcmp(bfr, "ping", 4), 0);

  CHECK_EQ(::write(fds[1], "pong", 4), 4);
  CHECK(POSIX::input_ready(fds[0], milliseconds(100)));
  CHECK_EQ(POSIX::read(fds[0], bfr, sizeof(bfr), milliseconds(100), t_o), 4);
  CHECK(!t_o);

  // EOF is -1 without a time out.
  close(fds[1]);
  CHECK_EQ(POSIX::read(fds[0], bfr, sizeof(bfr), milliseconds(100), t_o), -1);
  CHECK(!t_o);

  // Writing to a closed peer fails, without SIGPIPE.
  CHECK_EQ(POSIX::write(fds[0], "x", 1, milliseconds(100), t_o), -1);
  close(fds[0]);

  // connect(): a listener takes the connection, a bound socket that
  // isn't listening refuses it.
  int const lsn = socket(AF_INET, SOCK_STREAM, 0);
  PCHECK(lsn != -1);
  auto addr{sockaddr_in{}};
  addr.sin_family      = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  PCHECK(bind(lsn, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
  socklen_t len = sizeof(addr);
  PCHECK(getsockname(lsn, reinterpret_cast<sockaddr*>(&addr), &len) == 0);

  int const c0 = socket(AF_INET, SOCK_STREAM, 0);
  CHECK(!POSIX::connect(c0, reinterpret_cast<sockaddr*>(&addr), sizeof(addr),
                        milliseconds(1000)));
  close(c0);

  PCHECK(listen(lsn, 1) == 0);
  int const c1 = socket(AF_INET, SOCK_STREAM, 0);
  CHECK(POSIX::connect(c1, reinterpret_cast<sockaddr*>(&addr), sizeof(addr),
                       milliseconds(1000)));
  close(c1);
  close(lsn);
}
