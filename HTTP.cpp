#include "HTTP.hpp"

#include "Errors.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <thread>

#include <glog/logging.h>

#include <fmt/format.h>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

namespace {
std::uint64_t constexpr max_body_size = 64 * 1024 * 1024;

bool is_redirect(unsigned status)
{
  return (status == 301) || (status == 302) || (status == 303)
         || (status == 307) || (status == 308);
}

// Connect, optionally handshake, send one GET and read the reply.
// Each step is bounded by the timeout.
template <typename Stream, typename Handshake>
HTTP::Response exchange(net::io_context&          ioc,
                        Stream&                   stream,
                        HTTP::URL const&          url,
                        std::chrono::milliseconds timeout,
                        Handshake                 handshake)
{
  beast::error_code ec;

  tcp::resolver resolver(ioc);
  auto const    results = resolver.resolve(url.host, url.port, ec);
  if (ec) {
    throw ConnectionError(
        fmt::format("can't resolve {}: {}", url.host, ec.message()));
  }

  http::request<http::empty_body> req{http::verb::get, url.target, 11};
  req.set(http::field::host, url.host);
  req.set(http::field::user_agent, Config::http_user_agent);

  beast::flat_buffer                       buffer;
  http::response_parser<http::string_body> parser;
  parser.body_limit(max_body_size);

  auto& lowest = beast::get_lowest_layer(stream);

  lowest.expires_after(timeout);
  lowest.async_connect(results, [&](beast::error_code e, tcp::endpoint) {
    if ((ec = e))
      return;
    handshake([&](beast::error_code hs_ec) {
      if ((ec = hs_ec))
        return;
      lowest.expires_after(timeout);
      http::async_write(stream, req, [&](beast::error_code wr_ec, size_t) {
        if ((ec = wr_ec))
          return;
        lowest.expires_after(timeout);
        http::async_read(stream, buffer, parser,
                         [&](beast::error_code rd_ec, size_t) { ec = rd_ec; });
      });
    });
  });

  ioc.run();

  if (ec) {
    throw ConnectionError(fmt::format("GET {}://{}{} failed: {}", url.scheme,
                                      url.host, url.target, ec.message()));
  }

  auto res = parser.release();

  HTTP::Response rsp;
  rsp.status = res.result_int();
  rsp.body   = std::move(res.body());
  if (auto loc = res.find(http::field::location); loc != res.end())
    rsp.location = std::string(loc->value());
  return rsp;
}
} // namespace

namespace HTTP {

URL URL::parse(std::string_view url)
{
  URL ret;

  auto const sep = url.find("://");
  if (sep == std::string_view::npos)
    throw std::invalid_argument(fmt::format("no scheme in URL «{}»", url));
  ret.scheme = std::string(url.substr(0, sep));
  if ((ret.scheme != "http") && (ret.scheme != "https"))
    throw std::invalid_argument(fmt::format("unsupported URL «{}»", url));
  url.remove_prefix(sep + 3);

  auto const auth_end = url.find_first_of("/?");
  auto const authority
      = url.substr(0, std::min(auth_end, url.size()));
  if (authority.empty())
    throw std::invalid_argument("no host in URL");

  if (auto const colon = authority.rfind(':');
      colon != std::string_view::npos) {
    ret.host = std::string(authority.substr(0, colon));
    ret.port = std::string(authority.substr(colon + 1));
  }
  else {
    ret.host = std::string(authority);
    ret.port = (ret.scheme == "https") ? "443" : "80";
  }

  if (auth_end == std::string_view::npos) {
    ret.target = "/";
  }
  else {
    ret.target = std::string(url.substr(auth_end));
    if (ret.target.front() == '?')
      ret.target.insert(0, 1, '/');
  }

  return ret;
}

std::string encode_component(std::string_view s)
{
  std::string ret;
  for (auto ch : s) {
    auto const c = static_cast<unsigned char>(ch);
    if (std::isalnum(c) || (c == '-') || (c == '.') || (c == '_')
        || (c == '~')) {
      ret += ch;
    }
    else {
      ret += fmt::format("%{:02X}", c);
    }
  }
  return ret;
}

Client::Client(std::chrono::milliseconds timeout,
               int                       retries,
               std::chrono::milliseconds backoff)
  : timeout_(timeout)
  , retries_(retries)
  , backoff_(backoff)
{
}

Response Client::get_once_(URL const& url)
{
  net::io_context ioc;

  if (url.scheme == "http") {
    beast::tcp_stream stream(ioc);
    return exchange(ioc, stream, url, timeout_,
                    [](auto next) { next(beast::error_code{}); });
  }

  ssl::context ctx(ssl::context::tls_client);
  ctx.set_default_verify_paths();

  beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
  if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
    throw ConnectionError(fmt::format("can't set SNI to {}", url.host));
  }
  stream.set_verify_mode(ssl::verify_peer);
  stream.set_verify_callback(ssl::host_name_verification(url.host));

  return exchange(ioc, stream, url, timeout_, [&](auto next) {
    beast::get_lowest_layer(stream).expires_after(timeout_);
    stream.async_handshake(ssl::stream_base::client, std::move(next));
  });
}

Response Client::get_retry_(URL const& url)
{
  auto delay = backoff_;
  for (auto attempt = 0;; ++attempt) {
    try {
      auto rsp = get_once_(url);
      if ((rsp.status < 500) || (attempt >= retries_))
        return rsp;
      LOG(WARNING) << "GET " << url.host << url.target << " returned "
                   << rsp.status << ", retrying";
    }
    catch (ConnectionError const& e) {
      if (attempt >= retries_)
        throw;
      LOG(WARNING) << e.what() << ", retrying";
    }
    std::this_thread::sleep_for(delay);
    delay *= 2;
  }
}

Response Client::get(std::string const& url_str)
{
  auto url = URL::parse(url_str);

  for (auto redirects = 0;; ++redirects) {
    auto rsp = get_retry_(url);
    if (!is_redirect(rsp.status) || rsp.location.empty())
      return rsp;
    if (redirects >= Config::http_max_redirects) {
      throw ConnectionError(fmt::format("too many redirects for {}", url_str));
    }

    VLOG(1) << "redirected to " << rsp.location;
    if (rsp.location.front() == '/') {
      url.target = rsp.location;
    }
    else {
      url = URL::parse(rsp.location);
    }
  }
}

} // namespace HTTP
