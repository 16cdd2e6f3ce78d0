#ifndef SOCK_DOT_HPP
#define SOCK_DOT_HPP

#include <chrono>
#include <istream>
#include <ostream>

#include "SockBuffer.hpp"

// A connected socket as a std::iostream with read and write timeouts.
// Owns the descriptor, closes it when destroyed.

class Sock {
public:
  Sock(const Sock&) = delete;
  Sock& operator=(const Sock&) = delete;

  Sock(int                       fd,
       std::chrono::milliseconds read_timeout  = Config::default_read_timeout,
       std::chrono::milliseconds write_timeout = Config::default_write_timeout);

  int fd() const { return fd_.fd; }

  bool timed_out() { return iostream_->timed_out(); }

  std::istream& in() { return iostream_; }
  std::ostream& out() { return iostream_; }

  void log_totals() { iostream_->log_totals(); }

private:
  // Declared before the stream so it's closed after the stream is gone.
  struct Descriptor {
    int fd;
    ~Descriptor();
  };

  Descriptor fd_;

  boost::iostreams::stream<SockBuffer> iostream_;
};

#endif // SOCK_DOT_HPP
