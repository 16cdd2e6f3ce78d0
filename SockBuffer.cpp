#include "SockBuffer.hpp"

#include "esc.hpp"

#include <cstdlib>
#include <string>

#include <glog/logging.h>

#include <gflags/gflags.h>

DEFINE_bool(log_data, false, "log all protocol data");

SockBuffer::SockBuffer(int                       fd,
                       std::chrono::milliseconds read_timeout,
                       std::chrono::milliseconds write_timeout)
  : fd_(fd)
  , read_timeout_(read_timeout)
  , write_timeout_(write_timeout)
{
  if (!POSIX::set_nonblocking(fd_)) {
    LOG(WARNING) << "socket " << fd_ << " left in blocking mode";
  }
  log_data_ = (FLAGS_log_data || (getenv("MAILVERIFY_LOG_DATA") != nullptr));
}

SockBuffer::SockBuffer(SockBuffer const& that)
  : fd_(that.fd_)
  , read_timeout_(that.read_timeout_)
  , write_timeout_(that.write_timeout_)
  , log_data_(that.log_data_)
{
  CHECK(!that.timed_out_);
}

std::streamsize SockBuffer::read(char* s, std::streamsize n)
{
  auto const read = POSIX::read(fd_, s, n, read_timeout_, timed_out_);
  if (read == static_cast<std::streamsize>(-1))
    return read;

  octets_read_ += read;

  if (log_data_) {
    auto str = std::string(s, static_cast<size_t>(read));
    LOG(INFO) << "< «" << esc(str, esc_line_option::multi) << "»";
  }

  return read;
}

std::streamsize SockBuffer::write(const char* s, std::streamsize n)
{
  auto const written = POSIX::write(fd_, s, n, write_timeout_, timed_out_);
  if (written == static_cast<std::streamsize>(-1)) {
    // The stream turns this into badbit.
    throw std::ios_base::failure(timed_out_ ? "write timed out"
                                            : "write failed");
  }

  octets_written_ += written;

  if (log_data_) {
    auto str = std::string(s, static_cast<size_t>(written));
    LOG(INFO) << "> «" << esc(str, esc_line_option::multi) << "»";
  }

  return written;
}

void SockBuffer::log_totals() const
{
  LOG(INFO) << "octets_read_==" << octets_read_;
  LOG(INFO) << "octets_written_==" << octets_written_;
}
