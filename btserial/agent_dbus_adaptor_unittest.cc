// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "btserial/agent_dbus_adaptor.h"

#include <stdint.h>

#include <map>
#include <memory>
#include <string>
#include <utility>

#include <base/bind.h>
#include <dbus/message.h>
#include <dbus/mock_bus.h>
#include <dbus/mock_exported_object.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "btserial/dbus_constants.h"
#include "btserial/mock_bluez_client.h"
#include "btserial/pairing_agent.h"

using testing::_;
using testing::Invoke;
using testing::Return;

namespace btserial {

namespace {

constexpr char kDevicePath[] = "/org/bluez/hci0/dev_00_11_22_33_44_55";

void SaveResponse(std::unique_ptr<dbus::Response>* out,
                  std::unique_ptr<dbus::Response> response) {
  *out = std::move(response);
}

}  // namespace

class AgentDBusAdaptorTest : public ::testing::Test {
 public:
  AgentDBusAdaptorTest() = default;

  void SetUp() override {
    ServiceOptions options;
    options.pin_code = "8642";
    context_.reset(new ServiceContext(options));
    agent_.reset(new PairingAgent(context_.get(), &bluez_client_));
    adaptor_.reset(new AgentDBusAdaptor(agent_.get()));

    dbus::Bus::Options bus_options;
    bus_options.bus_type = dbus::Bus::SYSTEM;
    bus_ = new dbus::MockBus(bus_options);
    exported_object_ =
        new dbus::MockExportedObject(bus_.get(),
                                     dbus::ObjectPath(kAgentObjectPath));
    EXPECT_CALL(*exported_object_, ExportMethodAndBlock(kAgentInterface, _, _))
        .Times(9)
        .WillRepeatedly(Invoke(this, &AgentDBusAdaptorTest::SaveHandler));
    adaptor_->ExportDBusMethods(exported_object_.get());
  }

 protected:
  bool SaveHandler(const std::string& interface_name,
                   const std::string& method_name,
                   dbus::ExportedObject::MethodCallCallback handler) {
    handlers_[method_name] = handler;
    return true;
  }

  // Dispatches |call| the way the bus would and returns the reply.
  std::unique_ptr<dbus::Response> Dispatch(dbus::MethodCall* call) {
    call->SetSerial(1);  // Arbitrary, but needed by libdbus.
    std::unique_ptr<dbus::Response> response;
    auto it = handlers_.find(call->GetMember());
    EXPECT_NE(handlers_.end(), it) << call->GetMember() << " not exported";
    if (it == handlers_.end())
      return response;
    it->second.Run(call, base::Bind(&SaveResponse, &response));
    return response;
  }

  std::unique_ptr<dbus::Response> CallWithDevice(const std::string& method) {
    dbus::MethodCall call(kAgentInterface, method);
    dbus::MessageWriter writer(&call);
    writer.AppendObjectPath(dbus::ObjectPath(kDevicePath));
    return Dispatch(&call);
  }

  MockBluezClient bluez_client_;
  std::unique_ptr<ServiceContext> context_;
  std::unique_ptr<PairingAgent> agent_;
  std::unique_ptr<AgentDBusAdaptor> adaptor_;

  scoped_refptr<dbus::MockBus> bus_;
  scoped_refptr<dbus::MockExportedObject> exported_object_;
  std::map<std::string, dbus::ExportedObject::MethodCallCallback> handlers_;
};

TEST_F(AgentDBusAdaptorTest, ExportsAllAgentMethods) {
  for (const char* method :
       {kAgentReleaseMethod, kAgentRequestPinCodeMethod,
        kAgentDisplayPinCodeMethod, kAgentRequestPasskeyMethod,
        kAgentDisplayPasskeyMethod, kAgentRequestConfirmationMethod,
        kAgentRequestAuthorizationMethod, kAgentAuthorizeServiceMethod,
        kAgentCancelMethod}) {
    EXPECT_EQ(1u, handlers_.count(method)) << method;
  }
}

TEST_F(AgentDBusAdaptorTest, RequestPinCodeRepliesWithPin) {
  std::unique_ptr<dbus::Response> response =
      CallWithDevice(kAgentRequestPinCodeMethod);
  ASSERT_TRUE(response);
  ASSERT_EQ(dbus::Message::MESSAGE_METHOD_RETURN, response->GetMessageType());

  dbus::MessageReader reader(response.get());
  std::string pin_code;
  ASSERT_TRUE(reader.PopString(&pin_code));
  EXPECT_EQ("8642", pin_code);
}

TEST_F(AgentDBusAdaptorTest, RequestPasskeyRepliesCanceled) {
  std::unique_ptr<dbus::Response> response =
      CallWithDevice(kAgentRequestPasskeyMethod);
  ASSERT_TRUE(response);
  EXPECT_EQ(dbus::Message::MESSAGE_ERROR, response->GetMessageType());
  EXPECT_EQ(bluez_error::kCanceled, response->GetErrorName());

  dbus::MessageReader reader(response.get());
  std::string message;
  ASSERT_TRUE(reader.PopString(&message));
  EXPECT_EQ(kPinOnlyPairingMessage, message);
}

TEST_F(AgentDBusAdaptorTest, RequestConfirmationRepliesCanceled) {
  dbus::MethodCall call(kAgentInterface, kAgentRequestConfirmationMethod);
  dbus::MessageWriter writer(&call);
  writer.AppendObjectPath(dbus::ObjectPath(kDevicePath));
  writer.AppendUint32(123456);

  std::unique_ptr<dbus::Response> response = Dispatch(&call);
  ASSERT_TRUE(response);
  EXPECT_EQ(bluez_error::kCanceled, response->GetErrorName());
}

TEST_F(AgentDBusAdaptorTest, DisplayPasskeyRepliesEmpty) {
  dbus::MethodCall call(kAgentInterface, kAgentDisplayPasskeyMethod);
  dbus::MessageWriter writer(&call);
  writer.AppendObjectPath(dbus::ObjectPath(kDevicePath));
  writer.AppendUint32(123456);
  writer.AppendUint16(2);

  std::unique_ptr<dbus::Response> response = Dispatch(&call);
  ASSERT_TRUE(response);
  EXPECT_EQ(dbus::Message::MESSAGE_METHOD_RETURN, response->GetMessageType());
  dbus::MessageReader reader(response.get());
  EXPECT_FALSE(reader.HasMoreData());
}

TEST_F(AgentDBusAdaptorTest, AuthorizeServiceTrustsDevice) {
  EXPECT_CALL(bluez_client_, SetTrusted(dbus::ObjectPath(kDevicePath)))
      .WillOnce(Return(true));

  dbus::MethodCall call(kAgentInterface, kAgentAuthorizeServiceMethod);
  dbus::MessageWriter writer(&call);
  writer.AppendObjectPath(dbus::ObjectPath(kDevicePath));
  writer.AppendString(kSerialPortUuid);

  std::unique_ptr<dbus::Response> response = Dispatch(&call);
  ASSERT_TRUE(response);
  EXPECT_EQ(dbus::Message::MESSAGE_METHOD_RETURN, response->GetMessageType());
}

TEST_F(AgentDBusAdaptorTest, AuthorizeServiceRepliesRejected) {
  EXPECT_CALL(bluez_client_, SetTrusted(_)).WillOnce(Return(false));

  dbus::MethodCall call(kAgentInterface, kAgentAuthorizeServiceMethod);
  dbus::MessageWriter writer(&call);
  writer.AppendObjectPath(dbus::ObjectPath(kDevicePath));
  writer.AppendString(kSerialPortUuid);

  std::unique_ptr<dbus::Response> response = Dispatch(&call);
  ASSERT_TRUE(response);
  EXPECT_EQ(bluez_error::kRejected, response->GetErrorName());
}

TEST_F(AgentDBusAdaptorTest, MissingArgumentsAreInvalid) {
  dbus::MethodCall call(kAgentInterface, kAgentRequestPinCodeMethod);
  std::unique_ptr<dbus::Response> response = Dispatch(&call);
  ASSERT_TRUE(response);
  EXPECT_EQ(DBUS_ERROR_INVALID_ARGS, response->GetErrorName());
}

TEST_F(AgentDBusAdaptorTest, ReleaseAndCancelReplyEmpty) {
  for (const char* method : {kAgentReleaseMethod, kAgentCancelMethod}) {
    dbus::MethodCall call(kAgentInterface, method);
    std::unique_ptr<dbus::Response> response = Dispatch(&call);
    ASSERT_TRUE(response);
    EXPECT_EQ(dbus::Message::MESSAGE_METHOD_RETURN,
              response->GetMessageType());
  }
}

}  // namespace btserial
