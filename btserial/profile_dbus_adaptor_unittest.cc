// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "btserial/profile_dbus_adaptor.h"

#include <sys/socket.h>

#include <memory>
#include <string>
#include <utility>

#include <base/bind.h>
#include <base/files/scoped_file.h>
#include <base/posix/eintr_wrapper.h>
#include <brillo/dbus/data_serialization.h>
#include <brillo/variant_dictionary.h>
#include <dbus/message.h>
#include <dbus/mock_bus.h>
#include <dbus/mock_exported_object.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "btserial/connection_handler.h"
#include "btserial/dbus_constants.h"

using testing::_;
using testing::Return;

namespace btserial {

namespace {

constexpr char kDevicePath[] = "/org/bluez/hci0/dev_00_11_22_33_44_55";

void SaveResponse(std::unique_ptr<dbus::Response>* out,
                  std::unique_ptr<dbus::Response> response) {
  *out = std::move(response);
}

}  // namespace

class ProfileDBusAdaptorTest : public ::testing::Test {
 public:
  ProfileDBusAdaptorTest() : adaptor_(&handler_) {}

  void SetUp() override {
    int fds[2];
    ASSERT_EQ(0, socketpair(AF_UNIX, SOCK_SEQPACKET, 0, fds));
    local_fd_.reset(fds[0]);
    remote_fd_.reset(fds[1]);
  }

 protected:
  std::unique_ptr<dbus::Response> CallNewConnection(int fd) {
    dbus::MethodCall call(kProfileInterface, kProfileNewConnectionMethod);
    call.SetSerial(1);  // Arbitrary, but needed by libdbus.
    dbus::MessageWriter writer(&call);
    writer.AppendObjectPath(dbus::ObjectPath(kDevicePath));
    writer.AppendFileDescriptor(fd);
    brillo::dbus_utils::AppendValueToWriter(&writer,
                                            brillo::VariantDictionary());

    std::unique_ptr<dbus::Response> response;
    adaptor_.NewConnection(&call, base::Bind(&SaveResponse, &response));
    return response;
  }

  std::string ReadReply() {
    char buffer[kReadChunkSize];
    ssize_t bytes = HANDLE_EINTR(
        recv(remote_fd_.get(), buffer, sizeof(buffer), MSG_DONTWAIT));
    return bytes > 0 ? std::string(buffer, bytes) : std::string();
  }

  ConnectionHandler handler_;
  ProfileDBusAdaptor adaptor_;
  base::ScopedFD local_fd_;
  base::ScopedFD remote_fd_;
};

TEST_F(ProfileDBusAdaptorTest, ExportsProfileMethods) {
  dbus::Bus::Options options;
  options.bus_type = dbus::Bus::SYSTEM;
  scoped_refptr<dbus::MockBus> bus = new dbus::MockBus(options);
  scoped_refptr<dbus::MockExportedObject> exported_object =
      new dbus::MockExportedObject(bus.get(),
                                   dbus::ObjectPath(kProfileObjectPath));
  EXPECT_CALL(*exported_object, ExportMethodAndBlock(
                                    kProfileInterface, kProfileReleaseMethod, _))
      .WillOnce(Return(true));
  EXPECT_CALL(*exported_object,
              ExportMethodAndBlock(kProfileInterface,
                                   kProfileNewConnectionMethod, _))
      .WillOnce(Return(true));
  EXPECT_CALL(*exported_object,
              ExportMethodAndBlock(kProfileInterface,
                                   kProfileRequestDisconnectionMethod, _))
      .WillOnce(Return(true));

  adaptor_.ExportDBusMethods(exported_object.get());
}

TEST_F(ProfileDBusAdaptorTest, NewConnectionRepliesThenServes) {
  const std::string request = "PING";
  ASSERT_EQ(static_cast<ssize_t>(request.size()),
            HANDLE_EINTR(send(remote_fd_.get(), request.data(),
                              request.size(), MSG_NOSIGNAL)));
  ASSERT_EQ(0, shutdown(remote_fd_.get(), SHUT_WR));

  // The session runs to completion inside the call.
  std::unique_ptr<dbus::Response> response =
      CallNewConnection(local_fd_.get());
  ASSERT_TRUE(response);
  EXPECT_EQ(dbus::Message::MESSAGE_METHOD_RETURN, response->GetMessageType());
  EXPECT_EQ("WAITING", ReadReply());
  EXPECT_EQ("SUCCESS PING", ReadReply());
  EXPECT_FALSE(handler_.has_descriptor());
}

TEST_F(ProfileDBusAdaptorTest, NewConnectionRejectedWhileConnected) {
  int other_fds[2];
  ASSERT_EQ(0, socketpair(AF_UNIX, SOCK_SEQPACKET, 0, other_fds));
  base::ScopedFD other_local(other_fds[0]);
  base::ScopedFD other_remote(other_fds[1]);

  ASSERT_TRUE(handler_.Accept(dbus::ObjectPath(kDevicePath),
                              std::move(other_local)));

  std::unique_ptr<dbus::Response> response =
      CallNewConnection(local_fd_.get());
  ASSERT_TRUE(response);
  EXPECT_EQ(bluez_error::kRejected, response->GetErrorName());
  EXPECT_TRUE(handler_.has_descriptor());
}

TEST_F(ProfileDBusAdaptorTest, NewConnectionWithoutDescriptorIsInvalid) {
  dbus::MethodCall call(kProfileInterface, kProfileNewConnectionMethod);
  call.SetSerial(1);
  dbus::MessageWriter writer(&call);
  writer.AppendObjectPath(dbus::ObjectPath(kDevicePath));

  std::unique_ptr<dbus::Response> response;
  adaptor_.NewConnection(&call, base::Bind(&SaveResponse, &response));
  ASSERT_TRUE(response);
  EXPECT_EQ(DBUS_ERROR_INVALID_ARGS, response->GetErrorName());
  EXPECT_FALSE(handler_.has_descriptor());
}

TEST_F(ProfileDBusAdaptorTest, RequestDisconnectionClosesDescriptor) {
  ASSERT_TRUE(handler_.Accept(dbus::ObjectPath(kDevicePath),
                              std::move(local_fd_)));

  for (int i = 0; i < 2; ++i) {
    dbus::MethodCall call(kProfileInterface,
                          kProfileRequestDisconnectionMethod);
    call.SetSerial(1);
    dbus::MessageWriter writer(&call);
    writer.AppendObjectPath(dbus::ObjectPath(kDevicePath));

    std::unique_ptr<dbus::Response> response =
        adaptor_.RequestDisconnection(&call);
    ASSERT_TRUE(response);
    EXPECT_EQ(dbus::Message::MESSAGE_METHOD_RETURN,
              response->GetMessageType());
    EXPECT_FALSE(handler_.has_descriptor());
  }
}

TEST_F(ProfileDBusAdaptorTest, ReleaseClosesDescriptor) {
  ASSERT_TRUE(handler_.Accept(dbus::ObjectPath(kDevicePath),
                              std::move(local_fd_)));

  dbus::MethodCall call(kProfileInterface, kProfileReleaseMethod);
  call.SetSerial(1);
  std::unique_ptr<dbus::Response> response = adaptor_.Release(&call);
  ASSERT_TRUE(response);
  EXPECT_FALSE(handler_.has_descriptor());
}

}  // namespace btserial
