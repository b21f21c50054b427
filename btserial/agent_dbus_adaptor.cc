// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "btserial/agent_dbus_adaptor.h"

#include <stdint.h>

#include <string>
#include <utility>

#include <base/bind.h>
#include <base/callback.h>
#include <base/logging.h>
#include <brillo/dbus/utils.h>
#include <brillo/errors/error.h>
#include <dbus/message.h>
#include <dbus/object_path.h>

#include "btserial/agent_interface.h"
#include "btserial/dbus_constants.h"
#include "btserial/dbus_utils.h"

namespace btserial {

namespace {

std::unique_ptr<dbus::Response> CreateErrorOrEmptyResponse(
    dbus::MethodCall* call, bool success, const brillo::ErrorPtr& error) {
  if (!success)
    return brillo::dbus_utils::GetDBusError(call, error.get());
  return dbus::Response::FromMethodCall(call);
}

}  // namespace

AgentDBusAdaptor::AgentDBusAdaptor(AgentInterface* impl) : impl_(impl) {
  DCHECK(impl_);
}

AgentDBusAdaptor::~AgentDBusAdaptor() = default;

void AgentDBusAdaptor::ExportDBusMethods(dbus::ExportedObject* object) {
  ExportSyncDBusMethod(object, kAgentReleaseMethod, &AgentDBusAdaptor::Release);
  ExportSyncDBusMethod(object, kAgentRequestPinCodeMethod,
                       &AgentDBusAdaptor::RequestPinCode);
  ExportSyncDBusMethod(object, kAgentDisplayPinCodeMethod,
                       &AgentDBusAdaptor::DisplayPinCode);
  ExportSyncDBusMethod(object, kAgentRequestPasskeyMethod,
                       &AgentDBusAdaptor::RequestPasskey);
  ExportSyncDBusMethod(object, kAgentDisplayPasskeyMethod,
                       &AgentDBusAdaptor::DisplayPasskey);
  ExportSyncDBusMethod(object, kAgentRequestConfirmationMethod,
                       &AgentDBusAdaptor::RequestConfirmation);
  ExportSyncDBusMethod(object, kAgentRequestAuthorizationMethod,
                       &AgentDBusAdaptor::RequestAuthorization);
  ExportSyncDBusMethod(object, kAgentAuthorizeServiceMethod,
                       &AgentDBusAdaptor::AuthorizeService);
  ExportSyncDBusMethod(object, kAgentCancelMethod, &AgentDBusAdaptor::Cancel);
}

std::unique_ptr<dbus::Response> AgentDBusAdaptor::Release(
    dbus::MethodCall* call) {
  brillo::ErrorPtr error;
  bool success = impl_->Release(&error);
  return CreateErrorOrEmptyResponse(call, success, error);
}

std::unique_ptr<dbus::Response> AgentDBusAdaptor::RequestPinCode(
    dbus::MethodCall* call) {
  dbus::ObjectPath device;
  dbus::MessageReader reader(call);
  if (!reader.PopObjectPath(&device))
    return CreateInvalidArgsError(call);

  brillo::ErrorPtr error;
  std::string pin_code;
  if (!impl_->RequestPinCode(&error, device, &pin_code))
    return brillo::dbus_utils::GetDBusError(call, error.get());

  std::unique_ptr<dbus::Response> response =
      dbus::Response::FromMethodCall(call);
  dbus::MessageWriter writer(response.get());
  writer.AppendString(pin_code);
  return response;
}

std::unique_ptr<dbus::Response> AgentDBusAdaptor::DisplayPinCode(
    dbus::MethodCall* call) {
  dbus::ObjectPath device;
  std::string pin_code;
  dbus::MessageReader reader(call);
  if (!reader.PopObjectPath(&device) || !reader.PopString(&pin_code))
    return CreateInvalidArgsError(call);

  brillo::ErrorPtr error;
  bool success = impl_->DisplayPinCode(&error, device, pin_code);
  return CreateErrorOrEmptyResponse(call, success, error);
}

std::unique_ptr<dbus::Response> AgentDBusAdaptor::RequestPasskey(
    dbus::MethodCall* call) {
  dbus::ObjectPath device;
  dbus::MessageReader reader(call);
  if (!reader.PopObjectPath(&device))
    return CreateInvalidArgsError(call);

  brillo::ErrorPtr error;
  uint32_t passkey = 0;
  if (!impl_->RequestPasskey(&error, device, &passkey))
    return brillo::dbus_utils::GetDBusError(call, error.get());

  std::unique_ptr<dbus::Response> response =
      dbus::Response::FromMethodCall(call);
  dbus::MessageWriter writer(response.get());
  writer.AppendUint32(passkey);
  return response;
}

std::unique_ptr<dbus::Response> AgentDBusAdaptor::DisplayPasskey(
    dbus::MethodCall* call) {
  dbus::ObjectPath device;
  uint32_t passkey = 0;
  uint16_t entered = 0;
  dbus::MessageReader reader(call);
  if (!reader.PopObjectPath(&device) || !reader.PopUint32(&passkey) ||
      !reader.PopUint16(&entered)) {
    return CreateInvalidArgsError(call);
  }

  brillo::ErrorPtr error;
  bool success = impl_->DisplayPasskey(&error, device, passkey, entered);
  return CreateErrorOrEmptyResponse(call, success, error);
}

std::unique_ptr<dbus::Response> AgentDBusAdaptor::RequestConfirmation(
    dbus::MethodCall* call) {
  dbus::ObjectPath device;
  uint32_t passkey = 0;
  dbus::MessageReader reader(call);
  if (!reader.PopObjectPath(&device) || !reader.PopUint32(&passkey))
    return CreateInvalidArgsError(call);

  brillo::ErrorPtr error;
  bool success = impl_->RequestConfirmation(&error, device, passkey);
  return CreateErrorOrEmptyResponse(call, success, error);
}

std::unique_ptr<dbus::Response> AgentDBusAdaptor::RequestAuthorization(
    dbus::MethodCall* call) {
  dbus::ObjectPath device;
  dbus::MessageReader reader(call);
  if (!reader.PopObjectPath(&device))
    return CreateInvalidArgsError(call);

  brillo::ErrorPtr error;
  bool success = impl_->RequestAuthorization(&error, device);
  return CreateErrorOrEmptyResponse(call, success, error);
}

std::unique_ptr<dbus::Response> AgentDBusAdaptor::AuthorizeService(
    dbus::MethodCall* call) {
  dbus::ObjectPath device;
  std::string uuid;
  dbus::MessageReader reader(call);
  if (!reader.PopObjectPath(&device) || !reader.PopString(&uuid))
    return CreateInvalidArgsError(call);

  brillo::ErrorPtr error;
  bool success = impl_->AuthorizeService(&error, device, uuid);
  return CreateErrorOrEmptyResponse(call, success, error);
}

std::unique_ptr<dbus::Response> AgentDBusAdaptor::Cancel(
    dbus::MethodCall* call) {
  brillo::ErrorPtr error;
  bool success = impl_->Cancel(&error);
  return CreateErrorOrEmptyResponse(call, success, error);
}

void AgentDBusAdaptor::ExportSyncDBusMethod(
    dbus::ExportedObject* object,
    const std::string& method_name,
    SyncDBusMethodCallMemberFunction member) {
  DCHECK(object);
  CHECK(object->ExportMethodAndBlock(
      kAgentInterface, method_name,
      base::Bind(&HandleSynchronousDBusMethodCall,
                 base::Bind(member, base::Unretained(this)))));
}

}  // namespace btserial
