// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "btserial/radio_setup.h"

#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "btserial/mock_command_runner.h"

using testing::_;
using testing::DoAll;
using testing::ElementsAre;
using testing::InSequence;
using testing::Return;
using testing::SetArgPointee;

namespace btserial {

namespace {

CommandResult MakeResult(int exit_code, const std::string& err) {
  CommandResult result;
  result.exit_code = exit_code;
  result.err = err;
  return result;
}

}  // namespace

class RadioSetupTest : public ::testing::Test {
 public:
  RadioSetupTest() : radio_setup_(&runner_, "hci1") {}

 protected:
  MockCommandRunner runner_;
  RadioSetup radio_setup_;
};

TEST_F(RadioSetupTest, RunsCommandsInOrder) {
  InSequence sequence;
  EXPECT_CALL(runner_, RunCommand(ElementsAre("hciconfig", "hci1", "up"), _))
      .WillOnce(DoAll(SetArgPointee<1>(MakeResult(0, "")), Return(true)));
  EXPECT_CALL(runner_, RunCommand(ElementsAre("hciconfig", "hci1", "sspmode",
                                              "0"),
                                  _))
      .WillOnce(DoAll(SetArgPointee<1>(MakeResult(0, "")), Return(true)));
  EXPECT_CALL(runner_,
              RunCommand(ElementsAre("hciconfig", "hci1", "piscan"), _))
      .WillOnce(DoAll(SetArgPointee<1>(MakeResult(0, "")), Return(true)));

  EXPECT_TRUE(radio_setup_.BringUp());
}

TEST_F(RadioSetupTest, StopsAtFirstFailure) {
  EXPECT_CALL(runner_, RunCommand(ElementsAre("hciconfig", "hci1", "up"), _))
      .WillOnce(DoAll(SetArgPointee<1>(MakeResult(1, "No such device\n")),
                      Return(true)));

  EXPECT_FALSE(radio_setup_.BringUp());
}

TEST_F(RadioSetupTest, LaunchFailure) {
  EXPECT_CALL(runner_, RunCommand(_, _)).WillOnce(Return(false));

  EXPECT_FALSE(radio_setup_.BringUp());
}

}  // namespace btserial
