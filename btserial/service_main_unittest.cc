// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "btserial/service_main.h"

#include <memory>
#include <string>
#include <vector>

#include <base/bind.h>
#include <base/files/file_path.h>
#include <base/files/file_util.h>
#include <base/files/scoped_temp_dir.h>
#include <gtest/gtest.h>

#include "btserial/service_lifecycle_manager.h"

namespace btserial {

namespace {

std::unique_ptr<ServiceDaemon> CountingFactory(int* calls,
                                               ServiceContext* context) {
  ++*calls;
  return nullptr;
}

}  // namespace

class ServiceMainTest : public ::testing::Test {
 public:
  void SetUp() override {
    ASSERT_TRUE(temp_dir_.CreateUniqueTempDir());
    options_.pid_file = temp_dir_.GetPath().Append("btserial.pid");
    options_.debug = true;
  }

 protected:
  int Run(const std::vector<std::string>& args) {
    return RunServiceAction(options_, args,
                            base::Bind(&CountingFactory, &factory_calls_));
  }

  base::ScopedTempDir temp_dir_;
  ServiceOptions options_;
  int factory_calls_ = 0;
};

TEST_F(ServiceMainTest, UnknownAction) {
  EXPECT_EQ(kExitUnknownAction, Run({"reload"}));
  EXPECT_EQ(0, factory_calls_);
  EXPECT_FALSE(base::PathExists(options_.pid_file));
}

TEST_F(ServiceMainTest, MissingAction) {
  EXPECT_EQ(kExitUnknownAction, Run({}));
  EXPECT_EQ(0, factory_calls_);
  EXPECT_FALSE(base::PathExists(options_.pid_file));
}

TEST_F(ServiceMainTest, ExtraArguments) {
  EXPECT_EQ(kExitUnknownAction, Run({"start", "now"}));
  EXPECT_EQ(0, factory_calls_);
}

TEST_F(ServiceMainTest, StopWhenNotRunning) {
  EXPECT_EQ(kExitSuccess, Run({"stop"}));
  EXPECT_EQ(0, factory_calls_);
}

}  // namespace btserial
