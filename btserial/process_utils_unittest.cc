// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "btserial/process_utils.h"

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <base/posix/eintr_wrapper.h>
#include <gtest/gtest.h>

namespace btserial {

namespace {

// Forks a child that exits immediately and reaps it. Returns its pid, which
// no longer names a process.
pid_t SpawnAndReapChild() {
  pid_t pid = fork();
  if (pid == 0)
    _exit(0);
  if (pid < 0)
    return pid;
  int status = 0;
  if (HANDLE_EINTR(waitpid(pid, &status, 0)) != pid)
    return -1;
  return pid;
}

}  // namespace

TEST(ProcessUtilsTest, CurrentProcessIsAlive) {
  ProcessUtilsImpl process_utils;
  EXPECT_EQ(getpid(), process_utils.GetCurrentPid());
  EXPECT_EQ(ProcessStatus::kAlive,
            process_utils.GetProcessStatus(process_utils.GetCurrentPid()));
  EXPECT_EQ(SignalResult::kDelivered,
            process_utils.SendSignal(getpid(), 0 /* signal */));
}

TEST(ProcessUtilsTest, ReapedChildIsGone) {
  const pid_t pid = SpawnAndReapChild();
  ASSERT_LT(0, pid);

  ProcessUtilsImpl process_utils;
  EXPECT_EQ(ProcessStatus::kGone, process_utils.GetProcessStatus(pid));
  EXPECT_EQ(SignalResult::kNoSuchProcess,
            process_utils.SendSignal(pid, 0 /* signal */));
}

TEST(ProcessUtilsTest, InvalidSignalFails) {
  ProcessUtilsImpl process_utils;
  EXPECT_EQ(SignalResult::kFailed, process_utils.SendSignal(getpid(), -1));
}

}  // namespace btserial
