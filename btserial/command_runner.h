// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BTSERIAL_COMMAND_RUNNER_H_
#define BTSERIAL_COMMAND_RUNNER_H_

#include <string>
#include <vector>

#include <base/macros.h>

namespace btserial {

struct CommandResult {
  int exit_code = -1;
  std::string out;
  std::string err;
};

// Runs external programs, an interface to enable unit testing.
class CommandRunner {
 public:
  virtual ~CommandRunner() = default;

  // Runs |argv| to completion. Returns false if the program could not be
  // started; otherwise |result| holds its exit code and output.
  virtual bool RunCommand(const std::vector<std::string>& argv,
                          CommandResult* result) = 0;
};

class CommandRunnerImpl : public CommandRunner {
 public:
  CommandRunnerImpl() = default;
  ~CommandRunnerImpl() override = default;

  bool RunCommand(const std::vector<std::string>& argv,
                  CommandResult* result) override;

 private:
  DISALLOW_COPY_AND_ASSIGN(CommandRunnerImpl);
};

}  // namespace btserial

#endif  // BTSERIAL_COMMAND_RUNNER_H_
