// Repository: MediaForge
// Component: Encoder progress parser implementation
// Copyright (c) 2026 MediaForge

#include "mediaforge/transcode/ProgressParser.hpp"

#include <algorithm>
#include <cctype>

namespace mediaforge::transcode {

namespace {

constexpr const char* kDurationKey = "Duration: ";
constexpr const char* kTimeKey = "time=";

// Value after `key` up to the next ',' or whitespace.
std::optional<std::string> ValueAfter(const std::string& line, const std::string& key) {
  const size_t start = line.find(key);
  if (start == std::string::npos) return std::nullopt;
  size_t pos = start + key.size();
  while (pos < line.size() && line[pos] == ' ') ++pos;
  size_t end = pos;
  while (end < line.size() && line[end] != ',' &&
         !std::isspace(static_cast<unsigned char>(line[end]))) {
    ++end;
  }
  return line.substr(pos, end - pos);
}

bool AllDigits(const std::string& s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
    return std::isdigit(c) != 0;
  });
}

}  // namespace

void ProgressParser::SetKnownDurationMs(int64_t duration_ms) {
  if (duration_ms > 0 && duration_ms_ == 0) duration_ms_ = duration_ms;
}

std::optional<int> ProgressParser::Feed(const std::string& bytes) {
  std::optional<int> latest;
  for (char c : bytes) {
    if (c == '\n' || c == '\r') {
      if (!partial_.empty()) {
        if (auto p = ParseLine(partial_)) latest = p;
        partial_.clear();
      }
      continue;
    }
    partial_ += c;
  }
  return latest;
}

std::optional<int> ProgressParser::Finish() {
  if (partial_.empty()) return std::nullopt;
  auto p = ParseLine(partial_);
  partial_.clear();
  return p;
}

std::optional<int> ProgressParser::ParseLine(const std::string& line) {
  if (auto duration = ValueAfter(line, kDurationKey)) {
    // The stream value wins over the probe; "N/A" is ignored.
    if (auto ms = ParseTimestampMs(*duration); ms && *ms > 0) duration_ms_ = *ms;
  }
  auto time = ValueAfter(line, kTimeKey);
  if (!time) return std::nullopt;
  auto ms = ParseTimestampMs(*time);
  if (!ms || duration_ms_ <= 0) return std::nullopt;
  position_ms_ = *ms;

  const int64_t raw = position_ms_ * 100 / duration_ms_;
  const int percent = static_cast<int>(std::min<int64_t>(100, std::max<int64_t>(0, raw)));
  if (percent <= percent_) return std::nullopt;
  percent_ = percent;
  return percent_;
}

std::optional<int64_t> ProgressParser::ParseTimestampMs(const std::string& text) {
  // HH:MM:SS[.frac]
  const size_t c1 = text.find(':');
  if (c1 == std::string::npos) return std::nullopt;
  const size_t c2 = text.find(':', c1 + 1);
  if (c2 == std::string::npos) return std::nullopt;
  const std::string hh = text.substr(0, c1);
  const std::string mm = text.substr(c1 + 1, c2 - c1 - 1);
  std::string ss = text.substr(c2 + 1);
  std::string frac;
  const size_t dot = ss.find('.');
  if (dot != std::string::npos) {
    frac = ss.substr(dot + 1);
    ss = ss.substr(0, dot);
  }
  if (!AllDigits(hh) || !AllDigits(mm) || !AllDigits(ss)) return std::nullopt;
  if (!frac.empty() && !AllDigits(frac)) return std::nullopt;
  if (hh.size() > 6 || mm.size() > 2 || ss.size() > 2) return std::nullopt;

  int64_t ms = (std::stoll(hh) * 3600 + std::stoll(mm) * 60 + std::stoll(ss)) * 1000;
  // Fraction digits beyond milliseconds are dropped.
  int64_t scale = 100;
  for (size_t i = 0; i < frac.size() && i < 3; ++i, scale /= 10) {
    ms += (frac[i] - '0') * scale;
  }
  return ms;
}

}  // namespace mediaforge::transcode
