// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "btserial/pid_file.h"

#include <string>

#include <base/files/file_util.h>
#include <base/files/scoped_temp_dir.h>
#include <gtest/gtest.h>

namespace btserial {

class PidFileTest : public ::testing::Test {
 public:
  PidFileTest() = default;

  void SetUp() override {
    ASSERT_TRUE(temp_dir_.CreateUniqueTempDir());
    path_ = temp_dir_.GetPath().Append("run").Append("test.pid");
  }

 protected:
  void WriteRaw(const std::string& contents) {
    ASSERT_TRUE(base::CreateDirectory(path_.DirName()));
    ASSERT_EQ(static_cast<int>(contents.size()),
              base::WriteFile(path_, contents.data(), contents.size()));
  }

  base::ScopedTempDir temp_dir_;
  base::FilePath path_;
};

TEST_F(PidFileTest, WriteThenRead) {
  PidFile pid_file(path_);
  ASSERT_TRUE(pid_file.Write(4321));

  std::string contents;
  ASSERT_TRUE(base::ReadFileToString(path_, &contents));
  EXPECT_EQ("4321\n", contents);

  base::Optional<pid_t> pid = pid_file.Read();
  ASSERT_TRUE(pid);
  EXPECT_EQ(4321, pid.value());
}

TEST_F(PidFileTest, MissingFile) {
  PidFile pid_file(path_);
  EXPECT_FALSE(pid_file.Read());
}

TEST_F(PidFileTest, MalformedContents) {
  PidFile pid_file(path_);

  WriteRaw("not a pid\n");
  EXPECT_FALSE(pid_file.Read());

  WriteRaw("");
  EXPECT_FALSE(pid_file.Read());

  WriteRaw("0\n");
  EXPECT_FALSE(pid_file.Read());

  WriteRaw("-12\n");
  EXPECT_FALSE(pid_file.Read());
}

TEST_F(PidFileTest, SurroundingWhitespace) {
  WriteRaw("  77 \n");
  base::Optional<pid_t> pid = PidFile(path_).Read();
  ASSERT_TRUE(pid);
  EXPECT_EQ(77, pid.value());
}

TEST_F(PidFileTest, Remove) {
  PidFile pid_file(path_);
  ASSERT_TRUE(pid_file.Write(99));
  EXPECT_TRUE(pid_file.Remove());
  EXPECT_FALSE(base::PathExists(path_));

  // Removing a missing file is not an error.
  EXPECT_TRUE(pid_file.Remove());
}

}  // namespace btserial
