// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "btserial/bluez_client.h"

#include <stdint.h>

#include <memory>
#include <string>

#include <brillo/dbus/data_serialization.h>
#include <brillo/variant_dictionary.h>
#include <dbus/message.h>
#include <dbus/mock_bus.h>
#include <dbus/mock_object_proxy.h>
#include <dbus/scoped_dbus_error.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "btserial/dbus_constants.h"
#include "btserial/profile_daemon.h"

using testing::_;
using testing::AnyNumber;
using testing::Invoke;
using testing::Return;

namespace btserial {

namespace {

constexpr char kDevicePath[] = "/org/bluez/hci0/dev_00_11_22_33_44_55";

// Note: The mock wraps the returned response back into a std::unique_ptr.
dbus::Response* CreateEmptyResponse(dbus::MethodCall* method_call) {
  method_call->SetSerial(1);
  return dbus::Response::FromMethodCall(method_call).release();
}

dbus::Response* CheckRegisterAgent(dbus::MethodCall* method_call,
                                   int /* timeout_ms */,
                                   dbus::ScopedDBusError* /* error */) {
  EXPECT_EQ(kAgentManagerInterface, method_call->GetInterface());
  EXPECT_EQ(kRegisterAgentMethod, method_call->GetMember());
  dbus::MessageReader reader(method_call);
  dbus::ObjectPath path;
  std::string capability;
  EXPECT_TRUE(reader.PopObjectPath(&path));
  EXPECT_TRUE(reader.PopString(&capability));
  EXPECT_FALSE(reader.HasMoreData());
  EXPECT_EQ(kAgentObjectPath, path.value());
  EXPECT_EQ(kAgentCapabilityKeyboardDisplay, capability);
  return CreateEmptyResponse(method_call);
}

dbus::Response* CheckRequestDefaultAgent(dbus::MethodCall* method_call,
                                         int /* timeout_ms */,
                                         dbus::ScopedDBusError* /* error */) {
  EXPECT_EQ(kAgentManagerInterface, method_call->GetInterface());
  EXPECT_EQ(kRequestDefaultAgentMethod, method_call->GetMember());
  dbus::MessageReader reader(method_call);
  dbus::ObjectPath path;
  EXPECT_TRUE(reader.PopObjectPath(&path));
  EXPECT_EQ(kAgentObjectPath, path.value());
  return CreateEmptyResponse(method_call);
}

dbus::Response* CheckRegisterProfile(dbus::MethodCall* method_call,
                                     int /* timeout_ms */,
                                     dbus::ScopedDBusError* /* error */) {
  EXPECT_EQ(kProfileManagerInterface, method_call->GetInterface());
  EXPECT_EQ(kRegisterProfileMethod, method_call->GetMember());
  dbus::MessageReader reader(method_call);
  dbus::ObjectPath path;
  std::string uuid;
  brillo::VariantDictionary options;
  EXPECT_TRUE(reader.PopObjectPath(&path));
  EXPECT_TRUE(reader.PopString(&uuid));
  EXPECT_TRUE(brillo::dbus_utils::PopValueFromReader(&reader, &options));
  EXPECT_EQ(kProfileObjectPath, path.value());
  EXPECT_EQ(kSerialPortUuid, uuid);
  EXPECT_EQ(7, brillo::GetVariantValueOrDefault<uint16_t>(
                   options, kProfileOptionChannel));
  EXPECT_TRUE(brillo::GetVariantValueOrDefault<bool>(
      options, kProfileOptionAutoConnect));
  EXPECT_EQ(kProfileRoleServer, brillo::GetVariantValueOrDefault<std::string>(
                                    options, kProfileOptionRole));
  return CreateEmptyResponse(method_call);
}

dbus::Response* CheckSetTrusted(dbus::MethodCall* method_call,
                                int /* timeout_ms */,
                                dbus::ScopedDBusError* /* error */) {
  EXPECT_EQ(kPropertiesInterface, method_call->GetInterface());
  EXPECT_EQ(kPropertiesSetMethod, method_call->GetMember());
  dbus::MessageReader reader(method_call);
  std::string interface_name;
  std::string property_name;
  bool value = false;
  EXPECT_TRUE(reader.PopString(&interface_name));
  EXPECT_TRUE(reader.PopString(&property_name));
  EXPECT_TRUE(reader.PopVariantOfBool(&value));
  EXPECT_EQ(kDeviceInterface, interface_name);
  EXPECT_EQ(kDeviceTrustedProperty, property_name);
  EXPECT_TRUE(value);
  return CreateEmptyResponse(method_call);
}

}  // namespace

class BluezClientTest : public ::testing::Test {
 public:
  BluezClientTest() = default;

  void SetUp() override {
    dbus::Bus::Options options;
    options.bus_type = dbus::Bus::SYSTEM;
    bus_ = new dbus::MockBus(options);
    bluez_proxy_ = new dbus::MockObjectProxy(
        bus_.get(), kBluezServiceName, dbus::ObjectPath(kBluezRootPath));
    device_proxy_ = new dbus::MockObjectProxy(bus_.get(), kBluezServiceName,
                                              dbus::ObjectPath(kDevicePath));

    // Ignore threading concerns.
    EXPECT_CALL(*bus_, AssertOnOriginThread()).Times(AnyNumber());
    EXPECT_CALL(*bus_, AssertOnDBusThread()).Times(AnyNumber());
    EXPECT_CALL(*bus_, GetObjectProxy(kBluezServiceName,
                                      dbus::ObjectPath(kBluezRootPath)))
        .WillRepeatedly(Return(bluez_proxy_.get()));
    EXPECT_CALL(*bus_,
                GetObjectProxy(kBluezServiceName, dbus::ObjectPath(kDevicePath)))
        .WillRepeatedly(Return(device_proxy_.get()));

    client_.reset(new BluezClientImpl(bus_));
  }

 protected:
  scoped_refptr<dbus::MockBus> bus_;
  scoped_refptr<dbus::MockObjectProxy> bluez_proxy_;
  scoped_refptr<dbus::MockObjectProxy> device_proxy_;
  std::unique_ptr<BluezClientImpl> client_;
};

TEST_F(BluezClientTest, RegisterAgent) {
  EXPECT_CALL(*bluez_proxy_, MockCallMethodAndBlockWithErrorDetails(_, _, _))
      .WillOnce(Invoke(&CheckRegisterAgent))
      .WillOnce(Invoke(&CheckRequestDefaultAgent));

  EXPECT_TRUE(client_->RegisterAgent(dbus::ObjectPath(kAgentObjectPath),
                                     kAgentCapabilityKeyboardDisplay));
  EXPECT_TRUE(client_->RequestDefaultAgent(dbus::ObjectPath(kAgentObjectPath)));
}

TEST_F(BluezClientTest, RegisterProfile) {
  EXPECT_CALL(*bluez_proxy_, MockCallMethodAndBlockWithErrorDetails(_, _, _))
      .WillOnce(Invoke(&CheckRegisterProfile));

  EXPECT_TRUE(client_->RegisterProfile(dbus::ObjectPath(kProfileObjectPath),
                                       kSerialPortUuid,
                                       GetSerialPortProfileOptions(7)));
}

TEST_F(BluezClientTest, SetTrustedUsesDeviceProxy) {
  EXPECT_CALL(*bluez_proxy_, MockCallMethodAndBlockWithErrorDetails(_, _, _))
      .Times(0);
  EXPECT_CALL(*device_proxy_, MockCallMethodAndBlockWithErrorDetails(_, _, _))
      .WillOnce(Invoke(&CheckSetTrusted));

  EXPECT_TRUE(client_->SetTrusted(dbus::ObjectPath(kDevicePath)));
}

TEST_F(BluezClientTest, FailedCallsReturnFalse) {
  EXPECT_CALL(*bluez_proxy_, MockCallMethodAndBlockWithErrorDetails(_, _, _))
      .WillRepeatedly(Return(nullptr));
  EXPECT_CALL(*device_proxy_, MockCallMethodAndBlockWithErrorDetails(_, _, _))
      .WillOnce(Return(nullptr));

  const dbus::ObjectPath agent_path(kAgentObjectPath);
  const dbus::ObjectPath profile_path(kProfileObjectPath);
  EXPECT_FALSE(client_->RegisterAgent(agent_path, "KeyboardDisplay"));
  EXPECT_FALSE(client_->RequestDefaultAgent(agent_path));
  EXPECT_FALSE(client_->UnregisterAgent(agent_path));
  EXPECT_FALSE(client_->RegisterProfile(profile_path, kSerialPortUuid,
                                        brillo::VariantDictionary()));
  EXPECT_FALSE(client_->UnregisterProfile(profile_path));
  EXPECT_FALSE(client_->SetTrusted(dbus::ObjectPath(kDevicePath)));
}

}  // namespace btserial
