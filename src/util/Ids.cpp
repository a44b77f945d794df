// Repository: MediaForge
// Component: Identifier and timestamp helpers implementation
// Copyright (c) 2026 MediaForge

#include "mediaforge/util/Ids.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <random>
#include <stdexcept>
#include <vector>

#include <openssl/rand.h>

namespace mediaforge::util {

namespace {

constexpr char kHexLower[] = "0123456789abcdef";
constexpr char kHexUpper[] = "0123456789ABCDEF";

std::mt19937& Generator() {
  static thread_local std::random_device rd;
  static thread_local std::mt19937 gen(rd());
  return gen;
}

}  // namespace

std::string GenerateUuidV4() {
  std::uniform_int_distribution<int> dis(0, 15);
  auto& gen = Generator();
  std::string out;
  out.reserve(36);
  for (int i = 0; i < 32; ++i) {
    if (i == 8 || i == 12 || i == 16 || i == 20) out += '-';
    if (i == 12) out += '4';
    else if (i == 16) out += kHexLower[8 + dis(gen) % 4];
    else out += kHexLower[dis(gen)];
  }
  return out;
}

std::string GenerateId(const std::string& prefix) {
  std::string uuid = GenerateUuidV4();
  std::string compact;
  compact.reserve(prefix.size() + 1 + 32);
  compact += prefix;
  compact += '_';
  for (char c : uuid) {
    if (c != '-') compact += c;
  }
  return compact;
}

std::string RandomHexUpper(std::size_t num_bytes) {
  std::vector<unsigned char> bytes(num_bytes);
  if (num_bytes > 0 && RAND_bytes(bytes.data(), static_cast<int>(num_bytes)) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  std::string out;
  out.reserve(num_bytes * 2);
  for (unsigned char b : bytes) {
    out += kHexUpper[(b >> 4) & 0xF];
    out += kHexUpper[b & 0xF];
  }
  return out;
}

int64_t NowUtcMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string FormatUtcIso8601(int64_t utc_ms) {
  time_t s = static_cast<time_t>(utc_ms / 1000);
  int frac_ms = static_cast<int>(utc_ms % 1000);
  struct tm tm;
  if (gmtime_r(&s, &tm) == nullptr) return "";
  char buf[64];
  int n = snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                   tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                   tm.tm_hour, tm.tm_min, tm.tm_sec, frac_ms);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "";
  return std::string(buf, static_cast<size_t>(n));
}

}  // namespace mediaforge::util
