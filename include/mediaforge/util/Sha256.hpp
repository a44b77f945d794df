// Repository: MediaForge
// Component: SHA-256 digest
// Purpose: Incremental SHA-256 over OpenSSL EVP for chunk and content hashes.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_UTIL_SHA256_HPP_
#define MEDIAFORGE_UTIL_SHA256_HPP_

#include <cstddef>
#include <string>

struct evp_md_ctx_st;

namespace mediaforge::util {

// Streaming hasher. Update() any number of times, then FinalHex() once.
// Throws std::runtime_error if OpenSSL cannot initialise the digest.
class Sha256 {
 public:
  Sha256();
  ~Sha256();

  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;

  void Update(const void* data, std::size_t len);
  void Update(const std::string& data) { Update(data.data(), data.size()); }

  // Lowercase hex digest. The hasher cannot be updated afterwards.
  std::string FinalHex();

  // One-shot convenience.
  static std::string HexDigest(const std::string& data);

 private:
  evp_md_ctx_st* ctx_;
  bool finalized_ = false;
};

}  // namespace mediaforge::util

#endif  // MEDIAFORGE_UTIL_SHA256_HPP_
