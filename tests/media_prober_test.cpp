#include <gtest/gtest.h>

#include "core/errors/Errors.hpp"
#include "core/media/MediaProber.hpp"

using namespace frl;

TEST(MediaProber, ParsesFormatAndFirstVideoStream) {
  const char* out = R"({
    "streams": [
      {"index": 0, "codec_type": "audio", "sample_rate": "48000"},
      {"index": 1, "codec_type": "video", "width": 1928, "height": 1208}
    ],
    "format": {"filename": "x.mp4", "duration": "3700.480000", "size": "734003200"}
  })";
  MediaInfo info = parseProbeOutput(out);
  EXPECT_DOUBLE_EQ(info.durationSeconds, 3700.48);
  EXPECT_EQ(info.byteSize, 734003200u);
  EXPECT_EQ(info.width, 1928);
  EXPECT_EQ(info.height, 1208);
}

TEST(MediaProber, MissingSizeIsLeftForTheCallerToFill) {
  MediaInfo info = parseProbeOutput(
    R"({"streams":[{"codec_type":"video","width":640,"height":480}],"format":{"duration":12.5}})");
  EXPECT_EQ(info.byteSize, 0u);
  EXPECT_DOUBLE_EQ(info.durationSeconds, 12.5);
}

TEST(MediaProber, RejectsMediaWithoutDuration) {
  EXPECT_THROW(parseProbeOutput(
                 R"({"streams":[{"codec_type":"video","width":1,"height":1}],"format":{"size":"10"}})"),
               ProbeError);
  EXPECT_THROW(parseProbeOutput(
                 R"({"streams":[{"codec_type":"video","width":1,"height":1}],"format":{"duration":"0.0"}})"),
               ProbeError);
}

TEST(MediaProber, RejectsMediaWithoutVideoStream) {
  EXPECT_THROW(parseProbeOutput(R"({"streams":[{"codec_type":"audio"}],"format":{"duration":"5"}})"),
               ProbeError);
}

TEST(MediaProber, RejectsGarbage) {
  EXPECT_THROW(parseProbeOutput("not json"), ProbeError);
  EXPECT_THROW(parseProbeOutput("{}"), ProbeError);
}

TEST(MediaProber, UnreadableFileFailsBeforeRunningFfprobe) {
  FfprobeProber prober("/nonexistent/ffprobe");
  EXPECT_THROW(prober.probe("/nonexistent/video.mp4"), ProbeError);
}

TEST(MediaProber, DisplayDurationRoundsUp) {
  EXPECT_EQ(displayDuration(3700.01), 3701);
  EXPECT_EQ(displayDuration(1800.0), 1800);
}
