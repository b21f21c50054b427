// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "btserial/service_lifecycle_manager.h"

#include <signal.h>

#include <base/bind.h>
#include <base/callback_helpers.h>
#include <base/logging.h>
#include <base/time/time.h>

namespace btserial {

namespace {

constexpr char kActionStart[] = "start";
constexpr char kActionStop[] = "stop";
constexpr char kActionRestart[] = "restart";

// Removes |pid_file| unless another instance has taken it over meanwhile.
void RemovePidFileIfOwned(const PidFile& pid_file, pid_t pid) {
  base::Optional<pid_t> recorded = pid_file.Read();
  if (recorded && recorded.value() != pid) {
    LOG(WARNING) << pid_file.path().value() << " now belongs to "
                 << recorded.value() << ", leaving it";
    return;
  }
  if (pid_file.Remove())
    LOG(INFO) << "Removed " << pid_file.path().value();
}

}  // namespace

base::Optional<LifecycleAction> ParseLifecycleAction(const std::string& name) {
  if (name == kActionStart)
    return LifecycleAction::kStart;
  if (name == kActionStop)
    return LifecycleAction::kStop;
  if (name == kActionRestart)
    return LifecycleAction::kRestart;
  return base::nullopt;
}

ServiceLifecycleManager::ServiceLifecycleManager(
    ServiceContext* context,
    ProcessUtils* process_utils,
    DaemonizeStrategy* daemonize_strategy,
    const RunCallback& run_callback)
    : context_(context),
      process_utils_(process_utils),
      daemonize_strategy_(daemonize_strategy),
      run_callback_(run_callback),
      pid_file_(context->options().pid_file) {
  CHECK(context_);
  CHECK(process_utils_);
  CHECK(daemonize_strategy_);
}

ServiceLifecycleManager::~ServiceLifecycleManager() = default;

int ServiceLifecycleManager::Perform(LifecycleAction action) {
  switch (action) {
    case LifecycleAction::kStart:
      return Start();
    case LifecycleAction::kStop:
      return Stop();
    case LifecycleAction::kRestart:
      return Restart();
  }
  NOTREACHED();
  return kExitUnknownAction;
}

bool ServiceLifecycleManager::IsAnotherInstanceRunning() {
  base::Optional<pid_t> pid = pid_file_.Read();
  if (!pid)
    return false;

  switch (process_utils_->GetProcessStatus(pid.value())) {
    case ProcessStatus::kAlive:
      return true;
    case ProcessStatus::kGone:
      LOG(INFO) << "Removing stale pid file " << pid_file_.path().value()
                << " of process " << pid.value();
      break;
    case ProcessStatus::kUnknown:
      LOG(WARNING) << "Cannot probe process " << pid.value()
                   << ", treating " << pid_file_.path().value()
                   << " as stale";
      break;
  }
  // Write() overwrites the file anyway.
  if (!pid_file_.Remove())
    LOG(WARNING) << "Keeping stale " << pid_file_.path().value();
  return false;
}

int ServiceLifecycleManager::Start() {
  state_ = ServiceState::kStarting;

  if (IsAnotherInstanceRunning()) {
    LOG(ERROR) << "Already running, see " << pid_file_.path().value();
    state_ = ServiceState::kStopped;
    return kExitFailure;
  }

  const ServiceOptions& options = context_->options();
  if (!options.debug && !options.single && !daemonize_strategy_->Detach()) {
    LOG(ERROR) << "Failed to detach from the terminal";
    state_ = ServiceState::kStopped;
    return kExitFailure;
  }

  const pid_t pid = process_utils_->GetCurrentPid();
  if (!pid_file_.Write(pid)) {
    state_ = ServiceState::kStopped;
    return kExitFailure;
  }
  base::ScopedClosureRunner remove_pid_file(
      base::Bind(&RemovePidFileIfOwned, pid_file_, pid));

  LOG(INFO) << "Running as pid " << pid;
  state_ = ServiceState::kRunning;
  const int exit_code = run_callback_.Run();
  state_ = ServiceState::kStopped;
  return exit_code;
}

int ServiceLifecycleManager::Stop() {
  state_ = ServiceState::kStopping;

  base::Optional<pid_t> pid = pid_file_.Read();
  if (!pid) {
    LOG(INFO) << "Not running";
    if (!pid_file_.Remove())
      LOG(WARNING) << "Failed to clean up " << pid_file_.path().value();
    state_ = ServiceState::kStopped;
    return kExitSuccess;
  }

  LOG(INFO) << "Stopping process " << pid.value();
  while (true) {
    const SignalResult result =
        process_utils_->SendSignal(pid.value(), SIGTERM);
    if (result == SignalResult::kNoSuchProcess)
      break;
    if (result == SignalResult::kFailed) {
      if (process_utils_->GetProcessStatus(pid.value()) !=
          ProcessStatus::kGone) {
        LOG(ERROR) << "Failed to stop process " << pid.value();
        state_ = ServiceState::kStopped;
        return kExitFailure;
      }
      break;
    }
    process_utils_->Sleep(
        base::TimeDelta::FromMilliseconds(kStopRetryDelayMs));
  }

  if (!pid_file_.Remove())
    LOG(WARNING) << "Failed to clean up " << pid_file_.path().value();
  LOG(INFO) << "Process " << pid.value() << " stopped";
  state_ = ServiceState::kStopped;
  return kExitSuccess;
}

int ServiceLifecycleManager::Restart() {
  const int exit_code = Stop();
  if (exit_code != kExitSuccess)
    return exit_code;
  return Start();
}

}  // namespace btserial
