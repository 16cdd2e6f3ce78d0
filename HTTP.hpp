#ifndef HTTP_DOT_HPP
#define HTTP_DOT_HPP

#include <chrono>
#include <string>
#include <string_view>

namespace Config {
constexpr auto http_timeout_default     = std::chrono::seconds(10);
constexpr auto http_retries_default     = 3;
constexpr auto http_backoff_default     = std::chrono::milliseconds(500);
constexpr auto http_max_redirects       = 5;
constexpr char const* http_user_agent   = "mailverify/1.0";
} // namespace Config

namespace HTTP {

struct Response {
  unsigned    status{0};
  std::string body;
  std::string location; // for redirects
};

// GET a URL.  Any status is returned as is, transport failures throw
// ConnectionError.
class Fetcher {
public:
  virtual ~Fetcher() = default;

  virtual Response get(std::string const& url) = 0;
};

struct URL {
  std::string scheme; // "http" or "https"
  std::string host;
  std::string port;
  std::string target; // path and query, at least "/"

  static URL parse(std::string_view url); // throws std::invalid_argument
};

// Percent encode everything outside the RFC 3986 unreserved set.
std::string encode_component(std::string_view s);

// HTTP/1.1 over TCP, TLS for https.  Retries 5xx replies and transport
// failures with exponential backoff, follows redirects.
class Client : public Fetcher {
public:
  explicit Client(
      std::chrono::milliseconds timeout = Config::http_timeout_default,
      int                       retries = Config::http_retries_default,
      std::chrono::milliseconds backoff = Config::http_backoff_default);

  Response get(std::string const& url) override;

private:
  Response get_once_(URL const& url);
  Response get_retry_(URL const& url);

  std::chrono::milliseconds timeout_;
  int                       retries_;
  std::chrono::milliseconds backoff_;
};

} // namespace HTTP

#endif // HTTP_DOT_HPP
