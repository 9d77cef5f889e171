#include "io/file_writer.hpp"
#include "test_util.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

namespace fs = std::filesystem;

TEST(AtomicReplace, CreatesAndReplaces) {
  testutil::TempDir dir;
  const auto path = dir.File("data.json");

  ASSERT_TRUE(io::AtomicReplace(path, "first"));
  auto first = io::ReadFile(path);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(*first, "first");

  ASSERT_TRUE(io::AtomicReplace(path, "second, longer"));
  auto second = io::ReadFile(path);
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(*second, "second, longer");
  EXPECT_FALSE(fs::exists(io::TempPathFor(path)));
}

TEST(AtomicReplace, FailureLeavesTargetUntouched) {
  testutil::TempDir dir;
  const auto path = dir.File("data.json");
  ASSERT_TRUE(io::AtomicReplace(path, "durable"));

  // A directory squatting on the temporary name makes open(2) fail
  fs::create_directory(io::TempPathFor(path));
  auto st = io::AtomicReplace(path, "never written");
  ASSERT_FALSE(st.has_value());
  EXPECT_EQ(st.error().category(), std::system_category());

  auto content = io::ReadFile(path);
  ASSERT_TRUE(content.has_value());
  EXPECT_EQ(*content, "durable");
}

TEST(ReadFile, MissingFileReportsErrno) {
  testutil::TempDir dir;
  auto r = io::ReadFile(dir.File("absent"));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), std::errc::no_such_file_or_directory);
}

TEST(EnsureParentDirectory, CreatesNestedDirectories) {
  testutil::TempDir dir;
  const auto path = (dir.Path() / "a" / "b" / "sessions.json").string();
  ASSERT_TRUE(io::EnsureParentDirectory(path));
  EXPECT_TRUE(fs::is_directory(dir.Path() / "a" / "b"));
  EXPECT_TRUE(io::EnsureParentDirectory("relative-file"));
}
