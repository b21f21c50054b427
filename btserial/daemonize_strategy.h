// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BTSERIAL_DAEMONIZE_STRATEGY_H_
#define BTSERIAL_DAEMONIZE_STRATEGY_H_

#include <base/macros.h>

namespace btserial {

// Turns the calling process into a background process.
class DaemonizeStrategy {
 public:
  virtual ~DaemonizeStrategy() = default;

  // Detaches the current process. Returns in the detached process only;
  // the intermediate parents exit. Returns false if detaching failed, in
  // which case the caller is still the original process.
  virtual bool Detach() = 0;
};

// Classic double fork: the daemon can never reacquire a controlling
// terminal, does not pin any mount point, and starts with stdio bound to
// /dev/null and no other inherited descriptors.
class ForkDaemonizeStrategy : public DaemonizeStrategy {
 public:
  ForkDaemonizeStrategy() = default;
  ~ForkDaemonizeStrategy() override = default;

  bool Detach() override;

 private:
  DISALLOW_COPY_AND_ASSIGN(ForkDaemonizeStrategy);
};

// Stays in the foreground; used for --debug and in tests.
class NoopDaemonizeStrategy : public DaemonizeStrategy {
 public:
  NoopDaemonizeStrategy() = default;
  ~NoopDaemonizeStrategy() override = default;

  bool Detach() override { return true; }

 private:
  DISALLOW_COPY_AND_ASSIGN(NoopDaemonizeStrategy);
};

}  // namespace btserial

#endif  // BTSERIAL_DAEMONIZE_STRATEGY_H_
