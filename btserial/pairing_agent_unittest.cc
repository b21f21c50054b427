// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "btserial/pairing_agent.h"

#include <memory>
#include <string>

#include <base/bind.h>
#include <brillo/errors/error_codes.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "btserial/dbus_constants.h"
#include "btserial/mock_bluez_client.h"

using testing::Return;

namespace btserial {

namespace {

constexpr char kDevicePath[] = "/org/bluez/hci0/dev_00_11_22_33_44_55";
constexpr char kOtherDevicePath[] = "/org/bluez/hci0/dev_66_77_88_99_AA_BB";

}  // namespace

class PairingAgentTest : public ::testing::Test {
 public:
  PairingAgentTest() : device_(kDevicePath) {}

 protected:
  void CreateAgent(const std::string& pin_code, bool single) {
    ServiceOptions options;
    options.pin_code = pin_code;
    options.single = single;
    context_.reset(new ServiceContext(options));
    context_->SetQuitClosure(
        base::Bind(&PairingAgentTest::OnQuit, base::Unretained(this)));
    agent_.reset(new PairingAgent(context_.get(), &bluez_client_));
  }

  void OnQuit() { quit_count_++; }

  void ExpectCanceled(const brillo::ErrorPtr& error) {
    ASSERT_TRUE(error);
    EXPECT_EQ(brillo::errors::dbus::kDomain, error->GetDomain());
    EXPECT_EQ(bluez_error::kCanceled, error->GetCode());
    EXPECT_EQ(kPinOnlyPairingMessage, error->GetMessage());
  }

  dbus::ObjectPath device_;
  MockBluezClient bluez_client_;
  std::unique_ptr<ServiceContext> context_;
  std::unique_ptr<PairingAgent> agent_;
  int quit_count_ = 0;
};

TEST_F(PairingAgentTest, RequestPinCodeReturnsConfiguredPin) {
  CreateAgent("123456", false);

  for (const char* path : {kDevicePath, kOtherDevicePath}) {
    brillo::ErrorPtr error;
    std::string pin_code;
    EXPECT_TRUE(
        agent_->RequestPinCode(&error, dbus::ObjectPath(path), &pin_code));
    EXPECT_EQ("123456", pin_code);
    EXPECT_FALSE(error);
  }
}

TEST_F(PairingAgentTest, RequestPasskeyIsCanceled) {
  CreateAgent("0000", false);

  for (const char* path : {kDevicePath, kOtherDevicePath}) {
    brillo::ErrorPtr error;
    uint32_t passkey = 0;
    EXPECT_FALSE(
        agent_->RequestPasskey(&error, dbus::ObjectPath(path), &passkey));
    ExpectCanceled(error);
  }
}

TEST_F(PairingAgentTest, RequestConfirmationIsCanceled) {
  CreateAgent("0000", false);

  for (uint32_t passkey : {0u, 123456u, 999999u}) {
    brillo::ErrorPtr error;
    EXPECT_FALSE(agent_->RequestConfirmation(&error, device_, passkey));
    ExpectCanceled(error);
  }
}

TEST_F(PairingAgentTest, ObservationalCallsSucceed) {
  CreateAgent("0000", false);
  EXPECT_CALL(bluez_client_, SetTrusted(device_)).Times(0);

  brillo::ErrorPtr error;
  EXPECT_TRUE(agent_->Release(&error));
  EXPECT_TRUE(agent_->DisplayPinCode(&error, device_, "0000"));
  EXPECT_TRUE(agent_->DisplayPasskey(&error, device_, 123456, 3));
  EXPECT_TRUE(agent_->RequestAuthorization(&error, device_));
  EXPECT_TRUE(agent_->Cancel(&error));
  EXPECT_FALSE(error);
  EXPECT_EQ(0, quit_count_);
}

TEST_F(PairingAgentTest, AuthorizeServiceTrustsDevice) {
  CreateAgent("0000", false);
  EXPECT_CALL(bluez_client_, SetTrusted(device_)).WillOnce(Return(true));

  brillo::ErrorPtr error;
  EXPECT_TRUE(agent_->AuthorizeService(&error, device_, kSerialPortUuid));
  EXPECT_FALSE(error);
  EXPECT_EQ(0, quit_count_);
}

TEST_F(PairingAgentTest, AuthorizeServiceQuitsInSingleMode) {
  CreateAgent("0000", true);
  EXPECT_CALL(bluez_client_, SetTrusted(device_)).WillOnce(Return(true));

  brillo::ErrorPtr error;
  EXPECT_TRUE(agent_->AuthorizeService(&error, device_, kSerialPortUuid));
  EXPECT_EQ(1, quit_count_);
}

TEST_F(PairingAgentTest, AuthorizeServiceRejectsWhenTrustFails) {
  CreateAgent("0000", true);
  EXPECT_CALL(bluez_client_, SetTrusted(device_)).WillOnce(Return(false));

  brillo::ErrorPtr error;
  EXPECT_FALSE(agent_->AuthorizeService(&error, device_, kSerialPortUuid));
  ASSERT_TRUE(error);
  EXPECT_EQ(bluez_error::kRejected, error->GetCode());
  EXPECT_EQ(0, quit_count_);
}

}  // namespace btserial
