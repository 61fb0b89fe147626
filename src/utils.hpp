#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

typedef struct evp_md_ctx_st EVP_MD_CTX;

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::string sha256_hex(std::string_view data);

// Cryptographically random bytes; throws std::runtime_error when the
// OpenSSL generator is unavailable.
std::vector<unsigned char> random_bytes(std::size_t count);
std::string random_token(std::size_t length);

// Incremental SHA-256 over a byte stream.
class Sha256Stream {
public:
  Sha256Stream();
  ~Sha256Stream();
  Sha256Stream(const Sha256Stream&) = delete;
  Sha256Stream& operator=(const Sha256Stream&) = delete;

  void update(const char* data, std::size_t size);
  std::string finish_hex();

private:
  struct CtxDeleter { void operator()(EVP_MD_CTX* ctx) const; };
  std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
  bool finished_ = false;
};

std::string to_lower(std::string value);
std::string trim_copy(std::string value);
bool iequals(std::string_view a, std::string_view b);
