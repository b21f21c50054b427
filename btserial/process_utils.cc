// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "btserial/process_utils.h"

#include <errno.h>
#include <signal.h>
#include <unistd.h>

#include <base/logging.h>
#include <base/threading/platform_thread.h>

namespace btserial {

pid_t ProcessUtilsImpl::GetCurrentPid() {
  return getpid();
}

ProcessStatus ProcessUtilsImpl::GetProcessStatus(pid_t pid) {
  if (kill(pid, 0) == 0)
    return ProcessStatus::kAlive;

  switch (errno) {
    case ESRCH:
      return ProcessStatus::kGone;
    case EPERM:
      // Exists, but belongs to somebody else.
      return ProcessStatus::kAlive;
    default:
      PLOG(ERROR) << "Failed to probe process " << pid;
      return ProcessStatus::kUnknown;
  }
}

SignalResult ProcessUtilsImpl::SendSignal(pid_t pid, int signal) {
  if (kill(pid, signal) == 0)
    return SignalResult::kDelivered;

  if (errno == ESRCH)
    return SignalResult::kNoSuchProcess;

  PLOG(ERROR) << "Failed to send signal " << signal << " to " << pid;
  return SignalResult::kFailed;
}

void ProcessUtilsImpl::Sleep(base::TimeDelta delay) {
  base::PlatformThread::Sleep(delay);
}

}  // namespace btserial
