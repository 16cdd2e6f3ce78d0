#include "Avatar.hpp"

#include "Errors.hpp"
#include "HTTP.hpp"
#include "Hash.hpp"
#include "Mailbox.hpp"

#include <iostream>

#include <glog/logging.h>

using namespace std::string_literals;

namespace {
class Fake_fetcher : public HTTP::Fetcher {
public:
  HTTP::Response rsp;
  std::string    last_url;

  HTTP::Response get(std::string const& url) override
  {
    last_url = url;
    return rsp;
  }
};
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const mbx = Mailbox{"Test", "news", "example.com"};

  // Lower case, no plus-tag.
  auto const hash = Avatar::hash(mbx);
  CHECK_EQ(hash, Hash::of("test@example.com"));

  auto fetcher = std::make_shared<Fake_fetcher>();
  Avatar avatar{fetcher, "https://avatars.example/avatar/"};

  fetcher->rsp = HTTP::Response{200, "\x89PNG some image", ""};
  auto const found = avatar.lookup(mbx);
  CHECK_EQ(fetcher->last_url,
           "https://avatars.example/avatar/" + hash + "?d=404");
  CHECK(found.url.has_value());
  CHECK_EQ(*found.url, "https://avatars.example/avatar/" + hash);

  fetcher->rsp = HTTP::Response{404, "", ""};
  CHECK(!avatar.lookup(mbx).url.has_value());

  auto threw = false;
  fetcher->rsp = HTTP::Response{500, "", ""};
  try {
    avatar.lookup(mbx);
  }
  catch (ConnectionError const& e) {
    threw = true;
  }
  CHECK(threw);

  // Only a 200 carries an image.
  for (auto status : {204U, 301U, 403U}) {
    fetcher->rsp = HTTP::Response{status, "", ""};
    auto threw   = false;
    try {
      avatar.lookup(mbx);
    }
    catch (ConnectionError const& e) {
      threw = true;
    }
    CHECK(threw) << "status " << status;
  }

  // Any 200 body other than the stock placeholder is an avatar.
  fetcher->rsp = HTTP::Response{200, "", ""};
  CHECK(avatar.lookup(mbx).url.has_value());

  Avatar gravatar{fetcher};
  fetcher->rsp = HTTP::Response{404, "", ""};
  gravatar.lookup(mbx);
  CHECK_EQ(fetcher->last_url,
           "https://www.gravatar.com/avatar/" + hash + "?d=404");

  std::cout << found << '\n';
}
