#include "Sock.hpp"

#include <glog/logging.h>

#include <unistd.h>

Sock::Descriptor::~Descriptor()
{
  if (::close(fd) == -1) {
    PLOG(WARNING) << "close(" << fd << ") failed";
  }
}

Sock::Sock(int                       fd,
           std::chrono::milliseconds read_timeout,
           std::chrono::milliseconds write_timeout)
  : fd_{fd}
  , iostream_(fd, read_timeout, write_timeout)
{
}
