// Repository: MediaForge
// Component: Quality preset and encoder command unit tests

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "mediaforge/transcode/FfmpegCommandBuilder.hpp"
#include "mediaforge/transcode/QualityPresets.hpp"

namespace mediaforge::transcode {
namespace {

bool Contains(const std::vector<std::string>& args, const std::string& value) {
  return std::find(args.begin(), args.end(), value) != args.end();
}

// Value following `flag` in argv, or "" if absent.
std::string ValueOf(const std::vector<std::string>& args, const std::string& flag) {
  auto it = std::find(args.begin(), args.end(), flag);
  if (it == args.end() || it + 1 == args.end()) return "";
  return *(it + 1);
}

TEST(QualityPresetsTest, CatalogOrderedHighestFirst) {
  const auto& presets = AllQualityPresets();
  ASSERT_EQ(presets.size(), 6u);
  EXPECT_EQ(presets.front().key, "4k");
  EXPECT_EQ(presets.back().key, "240p");
  for (size_t i = 1; i < presets.size(); ++i) {
    EXPECT_GT(presets[i - 1].height, presets[i].height);
  }
}

TEST(QualityPresetsTest, FindKnownAndUnknown) {
  auto hd = FindQualityPreset("1080p");
  ASSERT_TRUE(hd.has_value());
  EXPECT_EQ(hd->width, 1920);
  EXPECT_EQ(hd->height, 1080);
  EXPECT_EQ(hd->video_kbps, 8000);
  EXPECT_EQ(hd->fps, 60);
  EXPECT_FALSE(FindQualityPreset("bogus").has_value());
  EXPECT_FALSE(FindQualityPreset("1080P").has_value());
}

TEST(FfmpegCommandBuilderTest, TranscodeArgsCarryPresetSettings) {
  const auto preset = *FindQualityPreset("720p");
  EncoderOptions options;
  options.ffmpeg_path = "/opt/ffmpeg/bin/ffmpeg";
  const auto args = BuildTranscodeArgs(options, "/in/src.mov", "/out/j_720p.mp4", preset);

  ASSERT_FALSE(args.empty());
  EXPECT_EQ(args.front(), "/opt/ffmpeg/bin/ffmpeg");
  EXPECT_EQ(args.back(), "/out/j_720p.mp4");
  EXPECT_EQ(ValueOf(args, "-i"), "/in/src.mov");
  EXPECT_TRUE(Contains(args, "-y"));
  EXPECT_TRUE(Contains(args, "5000k"));
  EXPECT_FALSE(Contains(args, "h264_nvenc"));
}

TEST(FfmpegCommandBuilderTest, GpuSelectsHardwareEncoder) {
  EncoderOptions options;
  options.gpu_acceleration = true;
  const auto args =
      BuildTranscodeArgs(options, "in.mp4", "out.mp4", *FindQualityPreset("1080p"));
  EXPECT_TRUE(Contains(args, "h264_nvenc"));
}

TEST(FfmpegCommandBuilderTest, MetadataArgsTagWithoutReencoding) {
  EncoderOptions options;
  const auto args = BuildMetadataArgs(options, "in.mp4", "out.mp4",
                                      {{"forensic_signature", "MF-1-ABC"}});
  EXPECT_EQ(ValueOf(args, "-c"), "copy");
  EXPECT_TRUE(Contains(args, "forensic_signature=MF-1-ABC"));
  EXPECT_EQ(args.back(), "out.mp4");
}

}  // namespace
}  // namespace mediaforge::transcode
