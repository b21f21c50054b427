// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BTSERIAL_SERVICE_LIFECYCLE_MANAGER_H_
#define BTSERIAL_SERVICE_LIFECYCLE_MANAGER_H_

#include <stdint.h>

#include <string>

#include <base/callback.h>
#include <base/macros.h>
#include <base/optional.h>

#include "btserial/daemonize_strategy.h"
#include "btserial/pid_file.h"
#include "btserial/process_utils.h"
#include "btserial/service_context.h"

namespace btserial {

// Process exit codes of the btserial daemons.
constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUnknownAction = 2;

// Delay between two SIGTERMs while stopping a running instance.
constexpr int64_t kStopRetryDelayMs = 100;

enum class LifecycleAction {
  kStart,
  kStop,
  kRestart,
};

// Parses "start", "stop" or "restart".
base::Optional<LifecycleAction> ParseLifecycleAction(const std::string& name);

enum class ServiceState {
  kStopped,
  kStarting,
  kRunning,
  kStopping,
};

// Owns the pid-file of a daemon and implements start/stop/restart on top of
// it. At most one live process may hold the pid recorded in the file; this
// is enforced by probing the recorded pid before writing a new one.
class ServiceLifecycleManager {
 public:
  // Brings the radio up, registers with the bus and runs the dispatch loop.
  // Returns the process exit code.
  using RunCallback = base::Callback<int()>;

  // |context|, |process_utils| and |daemonize_strategy| must outlive this
  // object.
  ServiceLifecycleManager(ServiceContext* context,
                          ProcessUtils* process_utils,
                          DaemonizeStrategy* daemonize_strategy,
                          const RunCallback& run_callback);
  ~ServiceLifecycleManager();

  // Each returns the process exit code.
  int Start();
  int Stop();
  int Restart();
  int Perform(LifecycleAction action);

  ServiceState state() const { return state_; }

 private:
  // Returns true if the pid-file names a live process. Clears a stale
  // pid-file as a side effect.
  bool IsAnotherInstanceRunning();

  ServiceContext* context_;
  ProcessUtils* process_utils_;
  DaemonizeStrategy* daemonize_strategy_;
  RunCallback run_callback_;
  PidFile pid_file_;
  ServiceState state_ = ServiceState::kStopped;

  DISALLOW_COPY_AND_ASSIGN(ServiceLifecycleManager);
};

}  // namespace btserial

#endif  // BTSERIAL_SERVICE_LIFECYCLE_MANAGER_H_
