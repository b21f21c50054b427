// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "btserial/service_lifecycle_manager.h"

#include <signal.h>
#include <unistd.h>

#include <memory>
#include <string>

#include <base/bind.h>
#include <base/files/file_util.h>
#include <base/files/scoped_temp_dir.h>
#include <base/time/time.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "btserial/mock_daemonize_strategy.h"
#include "btserial/mock_process_utils.h"

using testing::_;
using testing::InSequence;
using testing::Return;

namespace btserial {

namespace {

constexpr pid_t kOtherPid = 31337;

}  // namespace

class ServiceLifecycleManagerTest : public ::testing::Test {
 public:
  ServiceLifecycleManagerTest() : own_pid_(getpid()) {}

  void SetUp() override {
    ASSERT_TRUE(temp_dir_.CreateUniqueTempDir());
    pid_path_ = temp_dir_.GetPath().Append("btserial.pid");
    ON_CALL(process_utils_, GetCurrentPid()).WillByDefault(Return(own_pid_));
  }

 protected:
  void CreateManager(bool debug, bool single = false) {
    ServiceOptions options;
    options.pid_file = pid_path_;
    options.debug = debug;
    options.single = single;
    context_.reset(new ServiceContext(options));
    manager_.reset(new ServiceLifecycleManager(
        context_.get(), &process_utils_, &daemonize_strategy_,
        base::Bind(&ServiceLifecycleManagerTest::OnRun,
                   base::Unretained(this))));
  }

  void WritePidFile(pid_t pid) {
    ASSERT_TRUE(PidFile(pid_path_).Write(pid));
  }

  std::string ReadPidFileContents() {
    std::string contents;
    EXPECT_TRUE(base::ReadFileToString(pid_path_, &contents));
    return contents;
  }

  int OnRun() {
    run_count_++;
    recorded_pid_ = PidFile(pid_path_).Read();
    state_during_run_ = manager_->state();
    return run_exit_code_;
  }

  const pid_t own_pid_;
  base::ScopedTempDir temp_dir_;
  base::FilePath pid_path_;

  MockProcessUtils process_utils_;
  MockDaemonizeStrategy daemonize_strategy_;
  std::unique_ptr<ServiceContext> context_;
  std::unique_ptr<ServiceLifecycleManager> manager_;

  int run_count_ = 0;
  int run_exit_code_ = kExitSuccess;
  base::Optional<pid_t> recorded_pid_;
  ServiceState state_during_run_ = ServiceState::kStopped;
};

TEST_F(ServiceLifecycleManagerTest, ParseLifecycleAction) {
  EXPECT_EQ(LifecycleAction::kStart, ParseLifecycleAction("start").value());
  EXPECT_EQ(LifecycleAction::kStop, ParseLifecycleAction("stop").value());
  EXPECT_EQ(LifecycleAction::kRestart,
            ParseLifecycleAction("restart").value());
  EXPECT_FALSE(ParseLifecycleAction("reload"));
  EXPECT_FALSE(ParseLifecycleAction(""));
  EXPECT_FALSE(ParseLifecycleAction("START"));
}

TEST_F(ServiceLifecycleManagerTest, StartWithoutPidFile) {
  CreateManager(true /* debug */);
  EXPECT_CALL(process_utils_, GetProcessStatus(_)).Times(0);
  EXPECT_CALL(daemonize_strategy_, Detach()).Times(0);

  EXPECT_EQ(kExitSuccess, manager_->Start());
  EXPECT_EQ(1, run_count_);
  ASSERT_TRUE(recorded_pid_);
  EXPECT_EQ(own_pid_, recorded_pid_.value());
  EXPECT_EQ(ServiceState::kRunning, state_during_run_);

  // The pid file goes away with the run.
  EXPECT_FALSE(base::PathExists(pid_path_));
  EXPECT_EQ(ServiceState::kStopped, manager_->state());
}

TEST_F(ServiceLifecycleManagerTest, StartWhenAlreadyRunning) {
  CreateManager(true /* debug */);
  WritePidFile(kOtherPid);
  EXPECT_CALL(process_utils_, GetProcessStatus(kOtherPid))
      .WillOnce(Return(ProcessStatus::kAlive));
  EXPECT_CALL(process_utils_, GetCurrentPid()).Times(0);

  EXPECT_EQ(kExitFailure, manager_->Start());
  EXPECT_EQ(0, run_count_);
  EXPECT_EQ(std::to_string(kOtherPid) + "\n", ReadPidFileContents());
}

TEST_F(ServiceLifecycleManagerTest, StartRemovesStalePidFile) {
  CreateManager(true /* debug */);
  WritePidFile(kOtherPid);
  EXPECT_CALL(process_utils_, GetProcessStatus(kOtherPid))
      .WillOnce(Return(ProcessStatus::kGone));

  EXPECT_EQ(kExitSuccess, manager_->Start());
  EXPECT_EQ(1, run_count_);
  ASSERT_TRUE(recorded_pid_);
  EXPECT_EQ(own_pid_, recorded_pid_.value());
}

TEST_F(ServiceLifecycleManagerTest, StartTreatsUnprobeablePidAsStale) {
  CreateManager(true /* debug */);
  WritePidFile(kOtherPid);
  EXPECT_CALL(process_utils_, GetProcessStatus(kOtherPid))
      .WillOnce(Return(ProcessStatus::kUnknown));

  EXPECT_EQ(kExitSuccess, manager_->Start());
  EXPECT_EQ(1, run_count_);
}

TEST_F(ServiceLifecycleManagerTest, StartIgnoresMalformedPidFile) {
  CreateManager(true /* debug */);
  ASSERT_EQ(3, base::WriteFile(pid_path_, "abc", 3));
  EXPECT_CALL(process_utils_, GetProcessStatus(_)).Times(0);

  EXPECT_EQ(kExitSuccess, manager_->Start());
  EXPECT_EQ(1, run_count_);
}

TEST_F(ServiceLifecycleManagerTest, StartDetachesOutsideDebugMode) {
  CreateManager(false /* debug */);
  EXPECT_CALL(daemonize_strategy_, Detach()).WillOnce(Return(true));

  EXPECT_EQ(kExitSuccess, manager_->Start());
  EXPECT_EQ(1, run_count_);
}

TEST_F(ServiceLifecycleManagerTest, StartStaysInForegroundInSingleMode) {
  CreateManager(false /* debug */, true /* single */);
  EXPECT_CALL(daemonize_strategy_, Detach()).Times(0);

  EXPECT_EQ(kExitSuccess, manager_->Start());
  EXPECT_EQ(1, run_count_);
}

TEST_F(ServiceLifecycleManagerTest, StartWithNoopDetach) {
  ServiceOptions options;
  options.pid_file = pid_path_;
  ServiceContext context(options);
  NoopDaemonizeStrategy noop_strategy;
  ServiceLifecycleManager manager(
      &context, &process_utils_, &noop_strategy,
      base::Bind([](const base::FilePath& path) {
        base::Optional<pid_t> pid = PidFile(path).Read();
        return pid && pid.value() == getpid() ? kExitSuccess : kExitFailure;
      }, pid_path_));

  EXPECT_EQ(kExitSuccess, manager.Start());
  EXPECT_FALSE(base::PathExists(pid_path_));
}

TEST_F(ServiceLifecycleManagerTest, StartFailsWhenDetachFails) {
  CreateManager(false /* debug */);
  EXPECT_CALL(daemonize_strategy_, Detach()).WillOnce(Return(false));

  EXPECT_EQ(kExitFailure, manager_->Start());
  EXPECT_EQ(0, run_count_);
  EXPECT_FALSE(base::PathExists(pid_path_));
}

TEST_F(ServiceLifecycleManagerTest, StartReturnsRunExitCode) {
  CreateManager(true /* debug */);
  run_exit_code_ = kExitFailure;

  EXPECT_EQ(kExitFailure, manager_->Start());
  EXPECT_FALSE(base::PathExists(pid_path_));
}

TEST_F(ServiceLifecycleManagerTest, StopWithoutPidFile) {
  CreateManager(true /* debug */);
  EXPECT_CALL(process_utils_, SendSignal(_, _)).Times(0);

  EXPECT_EQ(kExitSuccess, manager_->Stop());
}

TEST_F(ServiceLifecycleManagerTest, StopSignalsUntilProcessIsGone) {
  CreateManager(true /* debug */);
  WritePidFile(kOtherPid);
  {
    InSequence sequence;
    EXPECT_CALL(process_utils_, SendSignal(kOtherPid, SIGTERM))
        .WillOnce(Return(SignalResult::kDelivered));
    EXPECT_CALL(process_utils_,
                Sleep(base::TimeDelta::FromMilliseconds(kStopRetryDelayMs)));
    EXPECT_CALL(process_utils_, SendSignal(kOtherPid, SIGTERM))
        .WillOnce(Return(SignalResult::kDelivered));
    EXPECT_CALL(process_utils_,
                Sleep(base::TimeDelta::FromMilliseconds(kStopRetryDelayMs)));
    EXPECT_CALL(process_utils_, SendSignal(kOtherPid, SIGTERM))
        .WillOnce(Return(SignalResult::kNoSuchProcess));
  }

  EXPECT_EQ(kExitSuccess, manager_->Stop());
  EXPECT_FALSE(base::PathExists(pid_path_));
  EXPECT_EQ(ServiceState::kStopped, manager_->state());
}

TEST_F(ServiceLifecycleManagerTest, StopFailsWhileProcessExists) {
  CreateManager(true /* debug */);
  WritePidFile(kOtherPid);
  EXPECT_CALL(process_utils_, SendSignal(kOtherPid, SIGTERM))
      .WillOnce(Return(SignalResult::kFailed));
  EXPECT_CALL(process_utils_, GetProcessStatus(kOtherPid))
      .WillOnce(Return(ProcessStatus::kAlive));

  EXPECT_EQ(kExitFailure, manager_->Stop());
  EXPECT_TRUE(base::PathExists(pid_path_));
}

TEST_F(ServiceLifecycleManagerTest, StopToleratesFailureOnVanishedProcess) {
  CreateManager(true /* debug */);
  WritePidFile(kOtherPid);
  EXPECT_CALL(process_utils_, SendSignal(kOtherPid, SIGTERM))
      .WillOnce(Return(SignalResult::kFailed));
  EXPECT_CALL(process_utils_, GetProcessStatus(kOtherPid))
      .WillOnce(Return(ProcessStatus::kGone));

  EXPECT_EQ(kExitSuccess, manager_->Stop());
  EXPECT_FALSE(base::PathExists(pid_path_));
}

TEST_F(ServiceLifecycleManagerTest, RestartStopsThenStarts) {
  CreateManager(true /* debug */);
  WritePidFile(kOtherPid);
  EXPECT_CALL(process_utils_, SendSignal(kOtherPid, SIGTERM))
      .WillOnce(Return(SignalResult::kNoSuchProcess));
  EXPECT_CALL(process_utils_, GetProcessStatus(_)).Times(0);

  EXPECT_EQ(kExitSuccess, manager_->Perform(LifecycleAction::kRestart));
  EXPECT_EQ(1, run_count_);
  ASSERT_TRUE(recorded_pid_);
  EXPECT_EQ(own_pid_, recorded_pid_.value());
}

TEST_F(ServiceLifecycleManagerTest, RestartAbortsWhenStopFails) {
  CreateManager(true /* debug */);
  WritePidFile(kOtherPid);
  EXPECT_CALL(process_utils_, SendSignal(kOtherPid, SIGTERM))
      .WillOnce(Return(SignalResult::kFailed));
  EXPECT_CALL(process_utils_, GetProcessStatus(kOtherPid))
      .WillOnce(Return(ProcessStatus::kAlive));

  EXPECT_EQ(kExitFailure, manager_->Restart());
  EXPECT_EQ(0, run_count_);
}

}  // namespace btserial
