// Repository: MediaForge
// Component: Encoder progress parser unit tests

#include <gtest/gtest.h>

#include "mediaforge/transcode/ProgressParser.hpp"

namespace mediaforge::transcode {
namespace {

TEST(ProgressParserTest, ParsesTimestamps) {
  EXPECT_EQ(ProgressParser::ParseTimestampMs("00:00:00.00"), 0);
  EXPECT_EQ(ProgressParser::ParseTimestampMs("01:02:03.45"), 3723450);
  EXPECT_EQ(ProgressParser::ParseTimestampMs("00:00:05"), 5000);
  EXPECT_EQ(ProgressParser::ParseTimestampMs("00:00:01.23456"), 1234);
  EXPECT_FALSE(ProgressParser::ParseTimestampMs("N/A").has_value());
  EXPECT_FALSE(ProgressParser::ParseTimestampMs("1:xx:00").has_value());
  EXPECT_FALSE(ProgressParser::ParseTimestampMs("").has_value());
}

TEST(ProgressParserTest, DurationThenTimeYieldsPercent) {
  ProgressParser parser;
  EXPECT_FALSE(parser.Feed("  Duration: 00:01:40.00, start: 0.000000, bitrate: 900 kb/s\n"));
  EXPECT_EQ(parser.duration_ms(), 100000);

  auto p = parser.Feed("frame=  100 fps=30 q=28.0 size=  100kB time=00:00:25.00 bitrate=1k\r");
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(*p, 25);
  EXPECT_EQ(parser.percent(), 25);
}

TEST(ProgressParserTest, LinesSplitAcrossFeeds) {
  ProgressParser parser;
  parser.SetKnownDurationMs(10000);
  EXPECT_FALSE(parser.Feed("frame= 10 time=00:00:0"));
  auto p = parser.Feed("5.00 bitrate=1k\r");
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(*p, 50);
}

TEST(ProgressParserTest, PercentNeverDecreasesAndCapsAtHundred) {
  ProgressParser parser;
  parser.SetKnownDurationMs(10000);
  EXPECT_EQ(parser.Feed("time=00:00:06.00\r"), 60);
  EXPECT_FALSE(parser.Feed("time=00:00:03.00\r").has_value());
  EXPECT_EQ(parser.percent(), 60);
  EXPECT_EQ(parser.Feed("time=00:00:12.00\r"), 100);
}

TEST(ProgressParserTest, NoDurationMeansNoProgress) {
  ProgressParser parser;
  EXPECT_FALSE(parser.Feed("  Duration: N/A, bitrate: N/A\n").has_value());
  EXPECT_FALSE(parser.Feed("time=00:00:05.00\r").has_value());
  EXPECT_EQ(parser.percent(), 0);
}

TEST(ProgressParserTest, StreamDurationReplacesProbedDuration) {
  ProgressParser parser;
  parser.SetKnownDurationMs(1000);
  parser.Feed("  Duration: 00:00:20.00, start: 0\n");
  EXPECT_EQ(parser.duration_ms(), 20000);
  EXPECT_EQ(parser.Feed("time=00:00:05.00\n"), 25);
}

TEST(ProgressParserTest, FinishFlushesUnterminatedLine) {
  ProgressParser parser;
  parser.SetKnownDurationMs(4000);
  EXPECT_FALSE(parser.Feed("time=00:00:04.00").has_value());
  EXPECT_EQ(parser.Finish(), 100);
  EXPECT_FALSE(parser.Finish().has_value());
}

}  // namespace
}  // namespace mediaforge::transcode
