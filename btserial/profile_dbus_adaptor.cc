// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "btserial/profile_dbus_adaptor.h"

#include <utility>

#include <base/bind.h>
#include <base/callback.h>
#include <base/files/scoped_file.h>
#include <base/logging.h>
#include <brillo/dbus/data_serialization.h>
#include <brillo/variant_dictionary.h>
#include <dbus/message.h>
#include <dbus/object_path.h>

#include "btserial/connection_handler.h"
#include "btserial/dbus_constants.h"
#include "btserial/dbus_utils.h"

namespace btserial {

namespace {

constexpr char kConnectionRefusedMessage[] = "Connection refused";

}  // namespace

ProfileDBusAdaptor::ProfileDBusAdaptor(ConnectionHandler* handler)
    : handler_(handler) {
  DCHECK(handler_);
}

ProfileDBusAdaptor::~ProfileDBusAdaptor() = default;

void ProfileDBusAdaptor::ExportDBusMethods(dbus::ExportedObject* object) {
  ExportSyncDBusMethod(object, kProfileReleaseMethod,
                       &ProfileDBusAdaptor::Release);
  ExportAsyncDBusMethod(object, kProfileNewConnectionMethod,
                        &ProfileDBusAdaptor::NewConnection);
  ExportSyncDBusMethod(object, kProfileRequestDisconnectionMethod,
                       &ProfileDBusAdaptor::RequestDisconnection);
}

std::unique_ptr<dbus::Response> ProfileDBusAdaptor::Release(
    dbus::MethodCall* call) {
  handler_->Release();
  return dbus::Response::FromMethodCall(call);
}

void ProfileDBusAdaptor::NewConnection(
    dbus::MethodCall* call,
    dbus::ExportedObject::ResponseSender response_sender) {
  dbus::ObjectPath device;
  base::ScopedFD fd;
  brillo::VariantDictionary fd_properties;
  dbus::MessageReader reader(call);
  if (!reader.PopObjectPath(&device) || !reader.PopFileDescriptor(&fd) ||
      !brillo::dbus_utils::PopValueFromReader(&reader, &fd_properties)) {
    response_sender.Run(CreateInvalidArgsError(call));
    return;
  }
  VLOG(1) << "NewConnection from " << device.value() << " with "
          << fd_properties.size() << " fd properties";

  // A refused |fd| is closed when Accept() drops it.
  if (!handler_->Accept(device, std::move(fd))) {
    response_sender.Run(dbus::ErrorResponse::FromMethodCall(
        call, bluez_error::kRejected, kConnectionRefusedMessage));
    return;
  }

  // The reply must go out before the request loop blocks the bus thread.
  response_sender.Run(dbus::Response::FromMethodCall(call));
  handler_->Run();
}

std::unique_ptr<dbus::Response> ProfileDBusAdaptor::RequestDisconnection(
    dbus::MethodCall* call) {
  dbus::ObjectPath device;
  dbus::MessageReader reader(call);
  if (!reader.PopObjectPath(&device))
    return CreateInvalidArgsError(call);

  handler_->RequestDisconnection(device);
  return dbus::Response::FromMethodCall(call);
}

void ProfileDBusAdaptor::ExportSyncDBusMethod(
    dbus::ExportedObject* object,
    const std::string& method_name,
    SyncDBusMethodCallMemberFunction member) {
  DCHECK(object);
  CHECK(object->ExportMethodAndBlock(
      kProfileInterface, method_name,
      base::Bind(&HandleSynchronousDBusMethodCall,
                 base::Bind(member, base::Unretained(this)))));
}

void ProfileDBusAdaptor::ExportAsyncDBusMethod(
    dbus::ExportedObject* object,
    const std::string& method_name,
    AsyncDBusMethodCallMemberFunction member) {
  DCHECK(object);
  CHECK(object->ExportMethodAndBlock(
      kProfileInterface, method_name,
      base::Bind(member, base::Unretained(this))));
}

}  // namespace btserial
