// Component: System Utilities Unit Tests
// Purpose: input discovery, output naming and progress rendering.

#include "hevc_batch/system.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "test_support.hpp"

using namespace hevc_batch;
using hevc_batch::test::TempDir;
using hevc_batch::test::write_file;

namespace fs = std::filesystem;

TEST(SystemTest, VideoExtensionsAreCaseInsensitive) {
  for (const char *name : {"a.mp4", "b.MKV", "c.avi", "d.Mov", "e.wmv",
                           "f.flv", "g.webm"}) {
    EXPECT_TRUE(has_video_extension(name)) << name;
  }
  for (const char *name : {"notes.txt", "movie.mkv.part", "mkv", "sub.srt",
                           ".encode_h265_resume.json"}) {
    EXPECT_FALSE(has_video_extension(name)) << name;
  }
}

TEST(SystemTest, CollectsSortedVideoFilesOnly) {
  TempDir dir;
  write_file(dir.file("c.mkv"), "");
  write_file(dir.file("a.mp4"), "");
  write_file(dir.file("B.avi"), "");
  write_file(dir.file("readme.txt"), "");
  write_file(dir.file("a_h265_mp3.mp4"), "");
  fs::create_directory(dir.file("folder.mkv"));

  auto files = collect_video_files(dir.path().string(), "_h265_mp3.mp4");
  EXPECT_EQ(files, (std::vector<std::string>{"B.avi", "a.mp4", "c.mkv"}));
}

TEST(SystemTest, EmptySuffixKeepsEverything) {
  TempDir dir;
  write_file(dir.file("a_h265_mp3.mp4"), "");

  auto files = collect_video_files(dir.path().string(), "");
  EXPECT_EQ(files, (std::vector<std::string>{"a_h265_mp3.mp4"}));
}

TEST(SystemTest, MissingDirectoryThrows) {
  TempDir dir;
  EXPECT_THROW(collect_video_files(dir.file("missing"), "_h265_mp3.mp4"),
               fs::filesystem_error);
}

TEST(SystemTest, OutputPathReplacesExtension) {
  EXPECT_EQ(output_path_for("/videos/My Movie.mkv", "_h265_mp3.mp4"),
            "/videos/My Movie_h265_mp3.mp4");
  EXPECT_EQ(output_path_for("clip.v2.avi", "_h265_mp3.mp4"),
            "clip.v2_h265_mp3.mp4");
}

TEST(SystemTest, ProgressBarAtStartAndMiddle) {
  std::string empty = render_progress_bar(0, 100, false);
  EXPECT_EQ(empty, "\r[" + std::string(40, '-') + "] 0% (0/100 frames)");

  std::string half = render_progress_bar(50, 100, false);
  EXPECT_EQ(half, "\r[" + std::string(20, '=') + std::string(20, '-') +
                      "] 50% (50/100 frames)");
}

TEST(SystemTest, ProgressBarClampsPastTotal) {
  std::string over = render_progress_bar(150, 100, false);
  EXPECT_EQ(over, "\r[" + std::string(40, '=') + "] 100% (150/100 frames)");
}

TEST(SystemTest, ProgressBarMarksResume) {
  std::string line = render_progress_bar(120, 1500, true);
  EXPECT_EQ(line.rfind("\r[RESUMING] [", 0), 0u);
  EXPECT_NE(line.find("8% (120/1500 frames)"), std::string::npos);
}

TEST(SystemTest, ProgressBarWithUnknownTotal) {
  std::string line = render_progress_bar(5, 0, false);
  EXPECT_NE(line.find("100% (5/1 frames)"), std::string::npos);
}

TEST(SystemTest, FormatTime) {
  EXPECT_EQ(format_time(0.0), "00:00:00");
  EXPECT_EQ(format_time(59.9), "00:00:59");
  EXPECT_EQ(format_time(3725.0), "01:02:05");
}
