// Component: Checkpoint Store Unit Tests
// Purpose: single-slot persistence, atomic replace and corrupt-file handling.

#include "hevc_batch/checkpoint_store.hpp"

#include <chrono>
#include <filesystem>

#include <gtest/gtest.h>

#include "test_support.hpp"

using namespace hevc_batch;
using hevc_batch::test::TempDir;
using hevc_batch::test::read_file;
using hevc_batch::test::write_file;

namespace {

double now_seconds() {
  return std::chrono::duration<double>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

} // namespace

TEST(CheckpointStoreTest, LoadWithoutFileIsEmpty) {
  TempDir dir;
  CheckpointStore store(dir.file("state.json"));

  EXPECT_FALSE(store.exists());
  EXPECT_FALSE(store.load().has_value());
}

TEST(CheckpointStoreTest, SaveThenLoadReturnsSamePair) {
  TempDir dir;
  CheckpointStore store(dir.file("state.json"));

  double before = now_seconds();
  ASSERT_TRUE(store.save("movie one.mkv", 120));

  auto cp = store.load();
  ASSERT_TRUE(cp.has_value());
  EXPECT_EQ(cp->file, "movie one.mkv");
  EXPECT_EQ(cp->frame, 120);
  EXPECT_GE(cp->timestamp, before - 1.0);
  EXPECT_LE(cp->timestamp, now_seconds() + 1.0);
}

TEST(CheckpointStoreTest, SurvivesANewStoreInstance) {
  TempDir dir;
  {
    CheckpointStore writer(dir.file("state.json"));
    ASSERT_TRUE(writer.save("a.mp4", 987654321));
  }

  CheckpointStore reader(dir.file("state.json"));
  auto cp = reader.load();
  ASSERT_TRUE(cp.has_value());
  EXPECT_EQ(cp->file, "a.mp4");
  EXPECT_EQ(cp->frame, 987654321);
}

TEST(CheckpointStoreTest, SaveOverwritesPreviousRecord) {
  TempDir dir;
  CheckpointStore store(dir.file("state.json"));

  ASSERT_TRUE(store.save("a.mkv", 10));
  ASSERT_TRUE(store.save("b.mkv", 20));

  auto cp = store.load();
  ASSERT_TRUE(cp.has_value());
  EXPECT_EQ(cp->file, "b.mkv");
  EXPECT_EQ(cp->frame, 20);
}

TEST(CheckpointStoreTest, SaveIsIdempotent) {
  TempDir dir;
  CheckpointStore store(dir.file("state.json"));

  ASSERT_TRUE(store.save("a.mkv", 42));
  ASSERT_TRUE(store.save("a.mkv", 42));

  auto cp = store.load();
  ASSERT_TRUE(cp.has_value());
  EXPECT_EQ(cp->file, "a.mkv");
  EXPECT_EQ(cp->frame, 42);
}

TEST(CheckpointStoreTest, SaveLeavesNoTempFileBehind) {
  TempDir dir;
  CheckpointStore store(dir.file("state.json"));

  ASSERT_TRUE(store.save("a.mkv", 1));
  EXPECT_TRUE(std::filesystem::exists(dir.file("state.json")));
  EXPECT_FALSE(std::filesystem::exists(dir.file("state.json.tmp")));
}

TEST(CheckpointStoreTest, WritesJsonObjectWithExpectedKeys) {
  TempDir dir;
  CheckpointStore store(dir.file("state.json"));
  ASSERT_TRUE(store.save("clip.mov", 7));

  std::string text = read_file(dir.file("state.json"));
  EXPECT_NE(text.find("\"file\""), std::string::npos);
  EXPECT_NE(text.find("\"frame\""), std::string::npos);
  EXPECT_NE(text.find("\"timestamp\""), std::string::npos);
  EXPECT_NE(text.find("clip.mov"), std::string::npos);
}

TEST(CheckpointStoreTest, ClearRemovesRecord) {
  TempDir dir;
  CheckpointStore store(dir.file("state.json"));

  ASSERT_TRUE(store.save("a.mkv", 5));
  store.clear();

  EXPECT_FALSE(store.exists());
  EXPECT_FALSE(store.load().has_value());
}

TEST(CheckpointStoreTest, ClearWhenAbsentIsNoop) {
  TempDir dir;
  CheckpointStore store(dir.file("state.json"));

  store.clear();
  store.clear();
  EXPECT_FALSE(store.load().has_value());
}

TEST(CheckpointStoreTest, NegativeFrameIsStoredAsZero) {
  TempDir dir;
  CheckpointStore store(dir.file("state.json"));

  ASSERT_TRUE(store.save("a.mkv", -5));
  auto cp = store.load();
  ASSERT_TRUE(cp.has_value());
  EXPECT_EQ(cp->frame, 0);
}

TEST(CheckpointStoreTest, CorruptContentReadsAsAbsent) {
  TempDir dir;
  CheckpointStore store(dir.file("state.json"));

  const char *bad_records[] = {
      "",
      "not json at all",
      "{\"file\": \"a.mkv\", \"fra",
      "[1, 2, 3]",
      "{\"frame\": 10}",
      "{\"file\": \"a.mkv\"}",
      "{\"file\": \"a.mkv\", \"frame\": \"ten\"}",
      "{\"file\": \"a.mkv\", \"frame\": -3}",
      "{\"file\": \"a.mkv\", \"frame\": 1.5}",
      "{\"file\": 17, \"frame\": 10}",
      "{\"file\": \"\", \"frame\": 10}",
  };

  for (const char *record : bad_records) {
    write_file(dir.file("state.json"), record);
    EXPECT_FALSE(store.load().has_value()) << "record: " << record;
  }
}

TEST(CheckpointStoreTest, MissingTimestampIsAccepted) {
  TempDir dir;
  CheckpointStore store(dir.file("state.json"));
  write_file(dir.file("state.json"), "{\"file\": \"a.mkv\", \"frame\": 33}");

  auto cp = store.load();
  ASSERT_TRUE(cp.has_value());
  EXPECT_EQ(cp->frame, 33);
  EXPECT_EQ(cp->timestamp, 0.0);
}

// An interrupted save leaves at most a stray temp file; the slot itself
// still holds the previous record.
TEST(CheckpointStoreTest, InterruptedSaveKeepsPreviousRecord) {
  TempDir dir;
  CheckpointStore store(dir.file("state.json"));
  ASSERT_TRUE(store.save("old.mkv", 100));

  write_file(dir.file("state.json.tmp"), "{\"file\": \"new.mkv\", \"fr");

  auto cp = store.load();
  ASSERT_TRUE(cp.has_value());
  EXPECT_EQ(cp->file, "old.mkv");
  EXPECT_EQ(cp->frame, 100);

  ASSERT_TRUE(store.save("new.mkv", 200));
  cp = store.load();
  ASSERT_TRUE(cp.has_value());
  EXPECT_EQ(cp->file, "new.mkv");
  EXPECT_EQ(cp->frame, 200);
  EXPECT_FALSE(std::filesystem::exists(dir.file("state.json.tmp")));
}

TEST(CheckpointStoreTest, InterruptedFirstSaveReadsAsAbsent) {
  TempDir dir;
  CheckpointStore store(dir.file("state.json"));

  write_file(dir.file("state.json.tmp"), "{\"file\": \"new.mkv\"");
  EXPECT_FALSE(store.load().has_value());
}

TEST(CheckpointStoreTest, SaveFailsWhenDirectoryIsMissing) {
  TempDir dir;
  CheckpointStore store(dir.file("missing/state.json"));

  EXPECT_FALSE(store.save("a.mkv", 1));
  EXPECT_FALSE(store.load().has_value());
}

// File names are bytes; a Latin-1 name must come back unchanged.
TEST(CheckpointStoreTest, NonUtf8NameRoundTrips) {
  TempDir dir;
  CheckpointStore store(dir.file("state.json"));
  const std::string name = "caf\xe9.mkv";

  ASSERT_TRUE(store.save(name, 120));

  auto cp = store.load();
  ASSERT_TRUE(cp.has_value());
  EXPECT_EQ(cp->file, name);
  EXPECT_EQ(cp->frame, 120);

  std::string text = read_file(dir.file("state.json"));
  EXPECT_NE(text.find("\"file_hex\""), std::string::npos);
  EXPECT_NE(text.find("636166e92e6d6b76"), std::string::npos);
}

TEST(CheckpointStoreTest, Utf8NameIsStoredPlain) {
  TempDir dir;
  CheckpointStore store(dir.file("state.json"));
  const std::string name = "caf\xc3\xa9.mkv";

  ASSERT_TRUE(store.save(name, 7));
  EXPECT_EQ(read_file(dir.file("state.json")).find("file_hex"),
            std::string::npos);

  auto cp = store.load();
  ASSERT_TRUE(cp.has_value());
  EXPECT_EQ(cp->file, name);
}

TEST(CheckpointStoreTest, MalformedHexNameReadsAsAbsent) {
  TempDir dir;
  CheckpointStore store(dir.file("state.json"));

  const char *bad_records[] = {
      "{\"file\": \"x\", \"file_hex\": \"abc\", \"frame\": 1}",
      "{\"file\": \"x\", \"file_hex\": \"zz\", \"frame\": 1}",
      "{\"file\": \"x\", \"file_hex\": 42, \"frame\": 1}",
      "{\"file\": \"x\", \"file_hex\": \"\", \"frame\": 1}",
  };
  for (const char *record : bad_records) {
    write_file(dir.file("state.json"), record);
    EXPECT_FALSE(store.load().has_value()) << "record: " << record;
  }
}
