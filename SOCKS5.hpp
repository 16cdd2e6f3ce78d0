#ifndef SOCKS5_DOT_HPP
#define SOCKS5_DOT_HPP

#include <chrono>
#include <cstdint>
#include <string>

// RFC 1928 client side: no authentication, CONNECT by domain name.

namespace SOCKS5 {

// On fd, already connected to the proxy, have the proxy connect to
// host:port.  Throws ConnectionError if the proxy refuses or the
// exchange fails.
void connect(int                       fd,
             std::string const&        host,
             uint16_t                  port,
             std::chrono::milliseconds timeout);

} // namespace SOCKS5

#endif // SOCKS5_DOT_HPP
