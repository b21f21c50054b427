// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "btserial/daemonize_strategy.h"

#include <fcntl.h>
#include <stdlib.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <unistd.h>

#include <base/files/scoped_file.h>
#include <base/logging.h>
#include <base/macros.h>
#include <base/posix/eintr_wrapper.h>

namespace btserial {

namespace {

// Used when RLIMIT_NOFILE is unlimited.
constexpr int kFallbackMaxFd = 1024;

constexpr char kDevNull[] = "/dev/null";

// Forks and lets the parent exit. Returns false in the original process if
// fork() failed.
bool ForkAndExitParent() {
  pid_t pid = fork();
  if (pid < 0) {
    PLOG(ERROR) << "fork failed";
    return false;
  }
  if (pid > 0)
    _exit(EXIT_SUCCESS);
  return true;
}

int GetMaxFd() {
  struct rlimit limit;
  if (getrlimit(RLIMIT_NOFILE, &limit) != 0 ||
      limit.rlim_max == RLIM_INFINITY) {
    return kFallbackMaxFd;
  }
  return static_cast<int>(limit.rlim_max);
}

}  // namespace

bool ForkDaemonizeStrategy::Detach() {
  if (!ForkAndExitParent())
    return false;

  if (setsid() < 0)
    PLOG(WARNING) << "setsid failed";

  if (!ForkAndExitParent())
    return false;

  if (chdir("/") != 0)
    PLOG(WARNING) << "chdir(/) failed";
  umask(0);

  const int max_fd = GetMaxFd();
  for (int fd = 0; fd < max_fd; ++fd)
    close(fd);

  // With everything closed, open() hands out 0 first.
  base::ScopedFD null_fd(HANDLE_EINTR(open(kDevNull, O_RDWR)));
  if (!null_fd.is_valid()) {
    PLOG(ERROR) << "Failed to open " << kDevNull;
    return true;
  }
  for (int fd = STDIN_FILENO; fd <= STDERR_FILENO; ++fd) {
    if (fd != null_fd.get() && HANDLE_EINTR(dup2(null_fd.get(), fd)) < 0)
      PLOG(ERROR) << "Failed to redirect fd " << fd << " to " << kDevNull;
  }
  if (null_fd.get() <= STDERR_FILENO)
    ignore_result(null_fd.release());

  return true;
}

}  // namespace btserial
