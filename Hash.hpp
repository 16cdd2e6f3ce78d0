#ifndef HASH_DOT_HPP
#define HASH_DOT_HPP

#include <string>
#include <string_view>

#include <openssl/evp.h>

#include <glog/logging.h>

#include <cppcodec/hex_lower.hpp>

// MD5, hex encoded.  Used as an identifier, not for security.

class Hash {
public:
  Hash(Hash const&) = delete;
  Hash& operator=(Hash const&) = delete;

  Hash()
    : ctx_(CHECK_NOTNULL(EVP_MD_CTX_new()))
  {
    CHECK_EQ(EVP_DigestInit_ex(ctx_, EVP_md5(), nullptr), 1);
  }
  ~Hash() { EVP_MD_CTX_free(ctx_); }

  void update(std::string_view s)
  {
    CHECK_EQ(EVP_DigestUpdate(ctx_, s.data(), s.length()), 1);
  }

  std::string final()
  {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int  md_len = 0;
    CHECK_EQ(EVP_DigestFinal_ex(ctx_, md, &md_len), 1);
    return cppcodec::hex_lower::encode(md, md_len);
  }

  static std::string of(std::string_view s)
  {
    Hash h;
    h.update(s);
    return h.final();
  }

private:
  EVP_MD_CTX* ctx_;
};

#endif // HASH_DOT_HPP
