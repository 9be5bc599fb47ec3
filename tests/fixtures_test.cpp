#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "fixtures.hpp"

using namespace gambit;

TEST(Fixtures, LoadPerftRecords) {
  const auto records = fixtures::load_perft(fixtures::perft_path());

  ASSERT_FALSE(records.empty());
  EXPECT_EQ(records.front().name, "startpos-d1");
  EXPECT_EQ(records.front().depth, 1);
  EXPECT_EQ(records.front().nodes, 20U);
}

TEST(Fixtures, TempDirIsRemovedOnDestruction) {
  std::filesystem::path kept;
  {
    const fixtures::TempDir dir("gambit-fixture");
    kept = dir.path();
    const auto file = dir.write_file("note.txt", "hello\n");
    EXPECT_TRUE(std::filesystem::exists(file));
  }
  EXPECT_FALSE(std::filesystem::exists(kept));
}

TEST(Fixtures, ScriptsAreExecutable) {
  const fixtures::TempDir dir("gambit-fixture");
  const auto script = dir.write_script("run.sh", "#!/bin/sh\nexit 0\n");

  const auto perms = std::filesystem::status(script).permissions();
  EXPECT_NE(perms & std::filesystem::perms::owner_exec, std::filesystem::perms::none);
}
