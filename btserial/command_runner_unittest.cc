// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "btserial/command_runner.h"

#include <string>

#include <gtest/gtest.h>

namespace btserial {

namespace {

constexpr char kShell[] = "/bin/sh";

}  // namespace

TEST(CommandRunnerTest, CapturesOutputAndExitCode) {
  CommandRunnerImpl runner;
  CommandResult result;
  ASSERT_TRUE(runner.RunCommand(
      {kShell, "-c", "echo up; echo 'no such adapter' >&2; exit 3"}, &result));
  EXPECT_EQ(3, result.exit_code);
  EXPECT_EQ("up\n", result.out);
  EXPECT_EQ("no such adapter\n", result.err);
}

// More stderr than a pipe buffers, written before anything on stdout.
TEST(CommandRunnerTest, LargeErrorOutputBeforeStandardOutput) {
  CommandRunnerImpl runner;
  CommandResult result;
  ASSERT_TRUE(runner.RunCommand(
      {kShell, "-c", "head -c 200000 /dev/zero >&2; echo done"}, &result));
  EXPECT_EQ(0, result.exit_code);
  EXPECT_EQ("done\n", result.out);
  EXPECT_EQ(200000u, result.err.size());
}

}  // namespace btserial
