// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BTSERIAL_MOCK_DAEMONIZE_STRATEGY_H_
#define BTSERIAL_MOCK_DAEMONIZE_STRATEGY_H_

#include <base/macros.h>
#include <gmock/gmock.h>

#include "btserial/daemonize_strategy.h"

namespace btserial {

class MockDaemonizeStrategy : public DaemonizeStrategy {
 public:
  MockDaemonizeStrategy() = default;
  ~MockDaemonizeStrategy() override = default;

  MOCK_METHOD0(Detach, bool());

 private:
  DISALLOW_COPY_AND_ASSIGN(MockDaemonizeStrategy);
};

}  // namespace btserial

#endif  // BTSERIAL_MOCK_DAEMONIZE_STRATEGY_H_
