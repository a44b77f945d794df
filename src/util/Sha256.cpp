// Repository: MediaForge
// Component: SHA-256 digest implementation
// Copyright (c) 2026 MediaForge

#include "mediaforge/util/Sha256.hpp"

#include <stdexcept>

#include <openssl/evp.h>

namespace mediaforge::util {

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
  if (ctx_ == nullptr) {
    throw std::runtime_error("Sha256: EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx_);
    throw std::runtime_error("Sha256: EVP_DigestInit_ex failed");
  }
}

Sha256::~Sha256() {
  EVP_MD_CTX_free(ctx_);
}

void Sha256::Update(const void* data, std::size_t len) {
  if (finalized_) {
    throw std::logic_error("Sha256: Update after FinalHex");
  }
  if (len == 0) return;
  if (EVP_DigestUpdate(ctx_, data, len) != 1) {
    throw std::runtime_error("Sha256: EVP_DigestUpdate failed");
  }
}

std::string Sha256::FinalHex() {
  if (finalized_) {
    throw std::logic_error("Sha256: FinalHex called twice");
  }
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_DigestFinal_ex(ctx_, digest, &digest_len) != 1) {
    throw std::runtime_error("Sha256: EVP_DigestFinal_ex failed");
  }
  finalized_ = true;

  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(digest_len * 2);
  for (unsigned int i = 0; i < digest_len; ++i) {
    out += kHex[(digest[i] >> 4) & 0xF];
    out += kHex[digest[i] & 0xF];
  }
  return out;
}

std::string Sha256::HexDigest(const std::string& data) {
  Sha256 hasher;
  hasher.Update(data);
  return hasher.FinalHex();
}

}  // namespace mediaforge::util
