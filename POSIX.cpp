#include "POSIX.hpp"

#include <cerrno>

#include <glog/logging.h>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

using std::chrono::duration_cast;
using std::chrono::milliseconds;
using std::chrono::steady_clock;

namespace {
bool wait_for(int fd, short events, milliseconds wait)
{
  auto pfd{pollfd{}};
  pfd.fd     = fd;
  pfd.events = events;

  for (;;) {
    auto const n = poll(&pfd, 1, static_cast<int>(wait.count()));
    if (n == -1) {
      if (errno == EINTR)
        continue;
      PLOG(WARNING) << "poll(2) failed";
      return false;
    }
    return n != 0;
  }
}
} // namespace

bool POSIX::set_nonblocking(int fd)
{
  int flags;
  if ((flags = fcntl(fd, F_GETFL, 0)) == -1) {
    PLOG(WARNING) << "fcntl(F_GETFL) failed";
    return false;
  }
  if (0 == (flags & O_NONBLOCK)) {
    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
      PLOG(WARNING) << "fcntl(F_SETFL) failed";
      return false;
    }
  }
  return true;
}

bool POSIX::input_ready(int fd_in, milliseconds wait)
{
  return wait_for(fd_in, POLLIN, wait);
}

bool POSIX::output_ready(int fd_out, milliseconds wait)
{
  return wait_for(fd_out, POLLOUT, wait);
}

bool POSIX::connect(int             fd,
                    sockaddr const* addr,
                    socklen_t       addrlen,
                    milliseconds    timeout)
{
  if (!set_nonblocking(fd))
    return false;

  if (::connect(fd, addr, addrlen) == 0)
    return true;
  if (errno != EINPROGRESS)
    return false;

  if (!output_ready(fd, timeout)) {
    errno = ETIMEDOUT;
    return false;
  }

  int       err = 0;
  socklen_t len = sizeof(err);
  if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == -1)
    return false;
  if (err != 0) {
    errno = err;
    return false;
  }
  return true;
}

std::streamsize POSIX::read(int             fd,
                            char*           s,
                            std::streamsize n,
                            milliseconds    timeout,
                            bool&           t_o)
{
  auto const end_time = steady_clock::now() + timeout;

  for (;;) {
    auto const n_ret = ::read(fd, static_cast<void*>(s), n);

    if (n_ret > 0)
      return n_ret;

    if (n_ret == 0) // EOF
      return -1;

    switch (errno) {
    case EINTR: continue; // try read again

    case EWOULDBLOCK:
#if EAGAIN != EWOULDBLOCK
    case EAGAIN:
#endif
      break;

    default: PLOG(WARNING) << "read(2) failed"; return -1;
    }

    auto const now = steady_clock::now();
    if (now < end_time) {
      auto const time_left = duration_cast<milliseconds>(end_time - now);
      if (input_ready(fd, time_left))
        continue; // try read again
    }
    t_o = true;
    LOG(WARNING) << "read(2) timed out";
    return -1;
  }
}

std::streamsize POSIX::write(int             fd,
                             const char*     s,
                             std::streamsize n,
                             milliseconds    timeout,
                             bool&           t_o)
{
  auto const end_time = steady_clock::now() + timeout;

  auto written = std::streamsize{};

  for (;;) {
    auto const n_ret
        = ::send(fd, static_cast<const void*>(s), n - written, MSG_NOSIGNAL);

    if (n_ret == -1) {
      switch (errno) {
      case EINTR: continue; // try write again

      case EWOULDBLOCK:
#if EAGAIN != EWOULDBLOCK
      case EAGAIN:
#endif
        break;

      default: PLOG(WARNING) << "send(2) failed"; return -1;
      }
    }
    else {
      s += n_ret;
      written += n_ret;
    }

    if (written == n)
      return n;

    auto const now = steady_clock::now();
    if (now < end_time) {
      auto const time_left = duration_cast<milliseconds>(end_time - now);
      if (output_ready(fd, time_left))
        continue; // write some more
    }
    t_o = true;
    LOG(WARNING) << "send(2) timed out";
    return -1;
  }
}
