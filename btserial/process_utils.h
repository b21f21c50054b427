// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BTSERIAL_PROCESS_UTILS_H_
#define BTSERIAL_PROCESS_UTILS_H_

#include <sys/types.h>

#include <base/macros.h>
#include <base/time/time.h>

namespace btserial {

// Result of probing a pid with signal 0.
enum class ProcessStatus {
  kAlive,    // The process exists (possibly owned by another user).
  kGone,     // No such process.
  kUnknown,  // The probe failed for another reason.
};

// Result of delivering a signal.
enum class SignalResult {
  kDelivered,
  kNoSuchProcess,
  kFailed,
};

// Thin wrapper around the process syscalls used by the lifecycle manager, an
// interface to enable unit testing.
class ProcessUtils {
 public:
  ProcessUtils() = default;
  virtual ~ProcessUtils() = default;

  virtual pid_t GetCurrentPid() = 0;

  // Checks whether |pid| exists without affecting it.
  virtual ProcessStatus GetProcessStatus(pid_t pid) = 0;

  // Sends |signal| to |pid|.
  virtual SignalResult SendSignal(pid_t pid, int signal) = 0;

  // Blocks the calling thread for |delay|.
  virtual void Sleep(base::TimeDelta delay) = 0;

 private:
  DISALLOW_COPY_AND_ASSIGN(ProcessUtils);
};

class ProcessUtilsImpl : public ProcessUtils {
 public:
  ProcessUtilsImpl() = default;
  ~ProcessUtilsImpl() override = default;

  // ProcessUtils overrides:
  pid_t GetCurrentPid() override;
  ProcessStatus GetProcessStatus(pid_t pid) override;
  SignalResult SendSignal(pid_t pid, int signal) override;
  void Sleep(base::TimeDelta delay) override;

 private:
  DISALLOW_COPY_AND_ASSIGN(ProcessUtilsImpl);
};

}  // namespace btserial

#endif  // BTSERIAL_PROCESS_UTILS_H_
