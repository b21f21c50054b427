// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BTSERIAL_MOCK_PROCESS_UTILS_H_
#define BTSERIAL_MOCK_PROCESS_UTILS_H_

#include <base/macros.h>
#include <gmock/gmock.h>

#include "btserial/process_utils.h"

namespace btserial {

class MockProcessUtils : public ProcessUtils {
 public:
  MockProcessUtils() = default;
  ~MockProcessUtils() override = default;

  MOCK_METHOD0(GetCurrentPid, pid_t());
  MOCK_METHOD1(GetProcessStatus, ProcessStatus(pid_t));
  MOCK_METHOD2(SendSignal, SignalResult(pid_t, int));
  MOCK_METHOD1(Sleep, void(base::TimeDelta));

 private:
  DISALLOW_COPY_AND_ASSIGN(MockProcessUtils);
};

}  // namespace btserial

#endif  // BTSERIAL_MOCK_PROCESS_UTILS_H_
