#include "HTTP.hpp"

#include "Errors.hpp"

#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <glog/logging.h>

using namespace std::string_literals;

namespace {
// Answers one connection per canned reply, recording each request line.
class Canned_server {
public:
  explicit Canned_server(std::vector<std::string> replies)
    : replies_(std::move(replies))
  {
    fd_ = socket(AF_INET, SOCK_STREAM, 0);
    PCHECK(fd_ != -1) << "socket";

    auto addr{sockaddr_in{}};
    addr.sin_family      = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port        = 0;
    PCHECK(bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    PCHECK(listen(fd_, 8) == 0);

    socklen_t len = sizeof(addr);
    PCHECK(getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    port_ = ntohs(addr.sin_port);

    thread_ = std::thread([this] { serve_(); });
  }

  ~Canned_server()
  {
    thread_.join();
    close(fd_);
  }

  uint16_t                        port() const { return port_; }
  std::vector<std::string> const& requests() const { return requests_; }

private:
  void serve_()
  {
    for (auto const& reply : replies_) {
      int const conn = accept(fd_, nullptr, nullptr);
      PCHECK(conn != -1) << "accept";

      std::string request;
      char        buf[1024];
      while (request.find("\r\n\r\n") == std::string::npos) {
        auto const n = read(conn, buf, sizeof(buf));
        if (n <= 0)
          break;
        request.append(buf, n);
      }
      requests_.push_back(request.substr(0, request.find("\r\n")));

      auto const wrote = write(conn, reply.data(), reply.size());
      PCHECK(wrote == static_cast<ssize_t>(reply.size()));
      close(conn);
    }
  }

  std::vector<std::string> replies_;
  std::vector<std::string> requests_;
  int                      fd_{-1};
  uint16_t                 port_{0};
  std::thread              thread_;
};

std::string reply(int status, std::string const& body, std::string extra = "")
{
  return "HTTP/1.1 " + std::to_string(status) + " Whatever\r\n"
         + "Content-Length: " + std::to_string(body.size()) + "\r\n"
         + "Connection: close\r\n" + extra + "\r\n" + body;
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const u0 = HTTP::URL::parse("https://dns.google/resolve?name=a&type=MX");
  CHECK_EQ(u0.scheme, "https"s);
  CHECK_EQ(u0.host, "dns.google"s);
  CHECK_EQ(u0.port, "443"s);
  CHECK_EQ(u0.target, "/resolve?name=a&type=MX"s);

  auto const u1 = HTTP::URL::parse("http://localhost:8080");
  CHECK_EQ(u1.host, "localhost"s);
  CHECK_EQ(u1.port, "8080"s);
  CHECK_EQ(u1.target, "/"s);

  auto const u2 = HTTP::URL::parse("http://example.com?q=1");
  CHECK_EQ(u2.port, "80"s);
  CHECK_EQ(u2.target, "/?q=1"s);

  for (auto bad : {"example.com/path", "ftp://example.com/", "https:///x"}) {
    auto threw = false;
    try {
      HTTP::URL::parse(bad);
    }
    catch (std::invalid_argument const& e) {
      threw = true;
    }
    CHECK(threw) << bad;
  }

  CHECK_EQ(HTTP::encode_component("gmail.com"), "gmail.com"s);
  CHECK_EQ(HTTP::encode_component("a b&c=d/é"), "a%20b%26c%3Dd%2F%C3%A9"s);
  CHECK_EQ(HTTP::encode_component("A-Z_0.9~"), "A-Z_0.9~"s);

  auto const fast = std::chrono::milliseconds(1);

  {
    // 5xx is retried.
    Canned_server server{{reply(503, "busy"), reply(200, "hello")}};
    HTTP::Client  client{std::chrono::seconds(5), 3, fast};
    auto const    rsp = client.get(
        "http://127.0.0.1:" + std::to_string(server.port()) + "/list.txt");
    CHECK_EQ(rsp.status, 200U);
    CHECK_EQ(rsp.body, "hello"s);
    CHECK_EQ(server.requests().size(), 2U);
    CHECK_EQ(server.requests()[0], "GET /list.txt HTTP/1.1"s);
  }

  {
    // Out of retries, the last reply is returned as is.
    Canned_server server{{reply(500, ""), reply(502, "")}};
    HTTP::Client  client{std::chrono::seconds(5), 1, fast};
    auto const    rsp = client.get("http://127.0.0.1:"
                                   + std::to_string(server.port()) + "/");
    CHECK_EQ(rsp.status, 502U);
  }

  {
    // 4xx is not retried.
    Canned_server server{{reply(404, "no")}};
    HTTP::Client  client{std::chrono::seconds(5), 3, fast};
    auto const    rsp = client.get("http://127.0.0.1:"
                                   + std::to_string(server.port()) + "/x");
    CHECK_EQ(rsp.status, 404U);
    CHECK_EQ(server.requests().size(), 1U);
  }

  {
    Canned_server server{{reply(302, "", "Location: /moved\r\n"),
                          reply(200, "here")}};
    HTTP::Client  client{std::chrono::seconds(5), 0, fast};
    auto const    rsp = client.get("http://127.0.0.1:"
                                   + std::to_string(server.port()) + "/orig");
    CHECK_EQ(rsp.body, "here"s);
    CHECK_EQ(server.requests()[1], "GET /moved HTTP/1.1"s);
  }

  {
    // Nobody listening.
    int const fd = socket(AF_INET, SOCK_STREAM, 0);
    auto addr{sockaddr_in{}};
    addr.sin_family      = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    PCHECK(bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    socklen_t len = sizeof(addr);
    PCHECK(getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);

    HTTP::Client client{std::chrono::seconds(5), 1, fast};
    auto         threw = false;
    try {
      client.get("http://127.0.0.1:" + std::to_string(ntohs(addr.sin_port))
                 + "/");
    }
    catch (ConnectionError const& e) {
      LOG(INFO) << "expected: " << e.what();
      threw = true;
    }
    CHECK(threw);
    close(fd);
  }
}
