#include "Sock.hpp"

#include <cstring>
#include <iostream>
#include <string>

#include <sys/socket.h>
#include <unistd.h>

#include <glog/logging.h>

using namespace std::string_literals;
using std::chrono::milliseconds;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  int fds[2];
  PCHECK(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);

  {
    Sock sock{fds[0], milliseconds(50), milliseconds(50)};
    CHECK_EQ(sock.fd(), fds[0]);

    auto const greeting = "220 ready\r\n250 ok\r\n"s;
    CHECK_EQ(::write(fds[1], greeting.data(), greeting.size()),
             static_cast<ssize_t>(greeting.size()));

    std::string line;
    CHECK(std::getline(sock.in(), line));
    CHECK_EQ(line, "220 ready\r"s);
    CHECK(std::getline(sock.in(), line));
    CHECK_EQ(line, "250 ok\r"s);
    CHECK(!sock.timed_out());

    sock.out() << "QUIT\r\n" << std::flush;
    CHECK(sock.out());
    char bfr[16];
    CHECK_EQ(::read(fds[1], bfr, sizeof(bfr)), 6);
    CHECK_EQ(std::memcmp(bfr, "QUIT\r\n", 6), 0);

    // Nothing more is coming.
    CHECK(!std::getline(sock.in(), line));
    CHECK(sock.timed_out());

    sock.log_totals();
  }

  // The Sock closed its end.
  char bfr[1];
  CHECK_EQ(::read(fds[1], bfr, sizeof(bfr)), 0);
  close(fds[1]);

  std::cout << "sizeof(Sock) == " << sizeof(Sock) << '\n';
}
