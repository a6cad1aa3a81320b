// Component: FFmpeg Executor Unit Tests
// Purpose: encoder command layout, seek offsets and start failures.

#include "hevc_batch/ffmpeg_executor.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include <gtest/gtest.h>

using namespace hevc_batch;

namespace {

Job make_job(double fps) {
  Job job;
  job.input_path = "in dir/movie.mkv";
  job.output_path = "in dir/movie_h265_mp3.mp4";
  job.info.codec = "h264";
  job.info.fps = fps;
  job.info.duration = 60.0;
  job.info.total_frames = static_cast<int64_t>(60.0 * fps);
  return job;
}

ptrdiff_t index_of(const std::vector<std::string> &v, const std::string &s) {
  auto it = std::find(v.begin(), v.end(), s);
  return it == v.end() ? -1 : std::distance(v.begin(), it);
}

} // namespace

TEST(FFmpegExecutorTest, FreshJobHasNoSeek) {
  EncoderSettings settings;
  auto cmd = build_encode_command(make_job(25.0), 0, settings);

  ASSERT_FALSE(cmd.empty());
  EXPECT_EQ(cmd.front(), "ffmpeg");
  EXPECT_EQ(cmd[1], "-nostdin");
  EXPECT_EQ(index_of(cmd, "-ss"), -1);
  EXPECT_EQ(cmd.back(), "in dir/movie_h265_mp3.mp4");

  ptrdiff_t i = index_of(cmd, "-i");
  ASSERT_GE(i, 0);
  EXPECT_EQ(cmd[i + 1], "in dir/movie.mkv");
}

TEST(FFmpegExecutorTest, EncoderParametersArePassed) {
  EncoderSettings settings;
  settings.x265_params = "ctu=32";
  settings.audio_quality = "2";
  auto cmd = build_encode_command(make_job(25.0), 0, settings);

  ptrdiff_t cv = index_of(cmd, "-c:v");
  ASSERT_GE(cv, 0);
  EXPECT_EQ(cmd[cv + 1], "libx265");

  ptrdiff_t xp = index_of(cmd, "-x265-params");
  ASSERT_GE(xp, 0);
  EXPECT_EQ(cmd[xp + 1], "ctu=32");

  ptrdiff_t qa = index_of(cmd, "-q:a");
  ASSERT_GE(qa, 0);
  EXPECT_EQ(cmd[qa + 1], "2");

  EXPECT_GE(index_of(cmd, "-y"), 0);
}

TEST(FFmpegExecutorTest, ResumeSeeksBeforeInput) {
  EncoderSettings settings;
  auto cmd = build_encode_command(make_job(25.0), 120, settings);

  ptrdiff_t ss = index_of(cmd, "-ss");
  ptrdiff_t in = index_of(cmd, "-i");
  ASSERT_GE(ss, 0);
  ASSERT_GE(in, 0);
  EXPECT_LT(ss, in);
  EXPECT_DOUBLE_EQ(std::stod(cmd[ss + 1]), 4.8);
}

TEST(FFmpegExecutorTest, SeekSecondsUsesFrameRate) {
  EXPECT_DOUBLE_EQ(seek_seconds(0, 30.0), 0.0);
  EXPECT_DOUBLE_EQ(seek_seconds(300, 30.0), 10.0);
  EXPECT_NEAR(seek_seconds(1001, 30000.0 / 1001.0), 1001.0 * 1001.0 / 30000.0,
              1e-9);
  /// Unusable rate falls back to 25 fps
  EXPECT_DOUBLE_EQ(seek_seconds(50, 0.0), 2.0);
}

TEST(FFmpegExecutorTest, CustomBinary) {
  EncoderSettings settings;
  settings.ffmpeg_bin = "/opt/ffmpeg/bin/ffmpeg";
  auto cmd = build_encode_command(make_job(25.0), 0, settings);
  EXPECT_EQ(cmd.front(), "/opt/ffmpeg/bin/ffmpeg");
}

TEST(FFmpegExecutorTest, FormatCommandQuotesSpaces) {
  std::string line = format_command({"ffmpeg", "-i", "a b.mkv", "out.mp4"});
  EXPECT_EQ(line, "ffmpeg -i \"a b.mkv\" out.mp4");
}

TEST(FFmpegExecutorTest, StartFailsForMissingBinary) {
  EncoderSettings settings;
  settings.ffmpeg_bin = "/nonexistent/hevc_batch/ffmpeg";
  JobDriver driver(settings);

  EXPECT_FALSE(driver.start(make_job(25.0), 0));
  EXPECT_FALSE(driver.process().running());
}
