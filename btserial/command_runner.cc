// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "btserial/command_runner.h"

#include <poll.h>
#include <unistd.h>

#include <base/logging.h>
#include <base/macros.h>
#include <base/posix/eintr_wrapper.h>
#include <base/strings/string_util.h>
#include <brillo/process.h>

namespace btserial {

namespace {

// Drains |out_fd| into |out| and |err_fd| into |err| until both reach EOF,
// reading whichever pipe has data.
bool ReadPipes(int out_fd, int err_fd, std::string* out, std::string* err) {
  struct pollfd fds[] = {
      {out_fd, POLLIN, 0},
      {err_fd, POLLIN, 0},
  };
  std::string* sinks[] = {out, err};
  char buffer[1024];
  while (fds[0].fd >= 0 || fds[1].fd >= 0) {
    if (HANDLE_EINTR(poll(fds, arraysize(fds), -1)) < 0) {
      PLOG(ERROR) << "Failed to wait for command output";
      return false;
    }
    for (size_t i = 0; i < arraysize(fds); ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0)
        continue;
      ssize_t bytes_read =
          HANDLE_EINTR(read(fds[i].fd, buffer, sizeof(buffer)));
      if (bytes_read < 0) {
        PLOG(ERROR) << "Failed to read command output";
        return false;
      }
      if (bytes_read == 0) {
        // poll() skips negative descriptors.
        fds[i].fd = -1;
        continue;
      }
      sinks[i]->append(buffer, bytes_read);
    }
  }
  return true;
}

}  // namespace

bool CommandRunnerImpl::RunCommand(const std::vector<std::string>& argv,
                                   CommandResult* result) {
  DCHECK(!argv.empty());
  DCHECK(result);

  const std::string command_line = base::JoinString(argv, " ");
  brillo::ProcessImpl process;
  for (const std::string& arg : argv)
    process.AddArg(arg);
  process.RedirectUsingPipe(STDOUT_FILENO, false /* is_input */);
  process.RedirectUsingPipe(STDERR_FILENO, false /* is_input */);

  if (!process.Start()) {
    LOG(ERROR) << "Failed to start '" << command_line << "'";
    return false;
  }

  result->out.clear();
  result->err.clear();
  if (!ReadPipes(process.GetPipe(STDOUT_FILENO), process.GetPipe(STDERR_FILENO),
                 &result->out, &result->err)) {
    LOG(WARNING) << "Output of '" << command_line << "' is incomplete";
  }

  result->exit_code = process.Wait();
  VLOG(1) << "'" << command_line << "' exited with " << result->exit_code;
  return true;
}

}  // namespace btserial
