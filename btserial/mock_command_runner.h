// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BTSERIAL_MOCK_COMMAND_RUNNER_H_
#define BTSERIAL_MOCK_COMMAND_RUNNER_H_

#include <string>
#include <vector>

#include <base/macros.h>
#include <gmock/gmock.h>

#include "btserial/command_runner.h"

namespace btserial {

class MockCommandRunner : public CommandRunner {
 public:
  MockCommandRunner() = default;
  ~MockCommandRunner() override = default;

  MOCK_METHOD2(RunCommand,
               bool(const std::vector<std::string>&, CommandResult*));

 private:
  DISALLOW_COPY_AND_ASSIGN(MockCommandRunner);
};

}  // namespace btserial

#endif  // BTSERIAL_MOCK_COMMAND_RUNNER_H_
