// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "btserial/dbus_utils.h"

#include <memory>
#include <string>
#include <utility>

#include <base/bind.h>
#include <dbus/message.h>
#include <gtest/gtest.h>

#include "btserial/dbus_constants.h"

namespace btserial {

namespace {

std::unique_ptr<dbus::Response> ReturnNull(dbus::MethodCall* call) {
  return nullptr;
}

std::unique_ptr<dbus::Response> ReturnInvalidArgs(dbus::MethodCall* call) {
  return CreateInvalidArgsError(call);
}

void SaveResponse(std::unique_ptr<dbus::Response>* out,
                  std::unique_ptr<dbus::Response> response) {
  *out = std::move(response);
}

}  // namespace

TEST(DBusUtilsTest, InvalidArgsErrorNamesSignature) {
  dbus::MethodCall call(kAgentInterface, kAgentDisplayPinCodeMethod);
  call.SetSerial(1);
  dbus::MessageWriter writer(&call);
  writer.AppendUint32(7);

  std::unique_ptr<dbus::Response> response = CreateInvalidArgsError(&call);
  ASSERT_TRUE(response);
  EXPECT_EQ(DBUS_ERROR_INVALID_ARGS, response->GetErrorName());
  dbus::MessageReader reader(response.get());
  std::string message;
  ASSERT_TRUE(reader.PopString(&message));
  EXPECT_EQ("Signature is: u", message);
}

TEST(DBusUtilsTest, SynchronousCallSendsEmptyResponseForNull) {
  dbus::MethodCall call(kAgentInterface, kAgentReleaseMethod);
  call.SetSerial(1);

  std::unique_ptr<dbus::Response> response;
  HandleSynchronousDBusMethodCall(base::Bind(&ReturnNull), &call,
                                  base::Bind(&SaveResponse, &response));
  ASSERT_TRUE(response);
  EXPECT_EQ(dbus::Message::MESSAGE_METHOD_RETURN, response->GetMessageType());
}

TEST(DBusUtilsTest, SynchronousCallForwardsHandlerResponse) {
  dbus::MethodCall call(kAgentInterface, kAgentReleaseMethod);
  call.SetSerial(1);

  std::unique_ptr<dbus::Response> response;
  HandleSynchronousDBusMethodCall(base::Bind(&ReturnInvalidArgs), &call,
                                  base::Bind(&SaveResponse, &response));
  ASSERT_TRUE(response);
  EXPECT_EQ(DBUS_ERROR_INVALID_ARGS, response->GetErrorName());
}

}  // namespace btserial
