#pragma once

#include <cstddef>
#include <string>

struct evp_md_ctx_st;

namespace fetchbox::storage {

/*
  Incremental SHA-256 over OpenSSL EVP.
*/
class Sha256 {
 public:
  Sha256();
  ~Sha256();

  Sha256(const Sha256&)            = delete;
  Sha256& operator=(const Sha256&) = delete;

  void Update(const char* data, size_t size);

  // Lowercase hex. Finalizes the digest; further updates are invalid.
  std::string HexDigest();

 private:
  evp_md_ctx_st* ctx_ = nullptr;
};

} // namespace fetchbox::storage
