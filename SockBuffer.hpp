#ifndef SOCKBUFFER_DOT_HPP
#define SOCKBUFFER_DOT_HPP

#include <chrono>
#include <ios>

#include "POSIX.hpp"

#include <boost/iostreams/concepts.hpp>
#include <boost/iostreams/stream.hpp>

namespace Config {
constexpr std::chrono::seconds default_read_timeout{5};
constexpr std::chrono::seconds default_write_timeout{5};
} // namespace Config

// A boost::iostreams device over one connected socket.  Doesn't own
// the descriptor, Sock does.

class SockBuffer
  : public boost::iostreams::device<boost::iostreams::bidirectional> {
public:
  SockBuffer(int                       fd,
             std::chrono::milliseconds read_timeout
             = Config::default_read_timeout,
             std::chrono::milliseconds write_timeout
             = Config::default_write_timeout);

  SockBuffer& operator=(const SockBuffer&) = delete;
  SockBuffer(SockBuffer const& that);

  bool timed_out() const { return timed_out_; }

  std::streamsize read(char* s, std::streamsize n);
  std::streamsize write(const char* s, std::streamsize n);

  void log_totals() const;

private:
  int fd_;

  std::streamsize octets_read_{0};
  std::streamsize octets_written_{0};

  std::chrono::milliseconds read_timeout_;
  std::chrono::milliseconds write_timeout_;

  bool timed_out_{false};
  bool log_data_{false};
};

#endif // SOCKBUFFER_DOT_HPP
