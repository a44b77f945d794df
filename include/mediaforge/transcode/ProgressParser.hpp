// Repository: MediaForge
// Component: Encoder progress parser
// Purpose: Turns the encoder's stderr stream into a completion percentage.
//          Recognises "Duration: HH:MM:SS.ss" (total) and
//          "time=HH:MM:SS.ss" (position). Lines end at '\n' or '\r'.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_TRANSCODE_PROGRESS_PARSER_HPP_
#define MEDIAFORGE_TRANSCODE_PROGRESS_PARSER_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace mediaforge::transcode {

// Not thread-safe; one parser per encoder invocation.
class ProgressParser {
 public:
  ProgressParser() = default;

  // Duration probed before the encode; used until the stream reports one.
  void SetKnownDurationMs(int64_t duration_ms);

  // Consumes raw output. Returns the new percentage if it increased.
  std::optional<int> Feed(const std::string& bytes);

  // Flushes a trailing unterminated line.
  std::optional<int> Finish();

  int percent() const { return percent_; }
  int64_t duration_ms() const { return duration_ms_; }
  int64_t position_ms() const { return position_ms_; }

  // "01:02:03.45" → 3723450. nullopt if malformed.
  static std::optional<int64_t> ParseTimestampMs(const std::string& text);

 private:
  std::optional<int> ParseLine(const std::string& line);

  std::string partial_;
  int64_t duration_ms_ = 0;
  int64_t position_ms_ = 0;
  int percent_ = 0;
};

}  // namespace mediaforge::transcode

#endif  // MEDIAFORGE_TRANSCODE_PROGRESS_PARSER_HPP_
