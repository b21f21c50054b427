// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "btserial/bluez_client.h"

#include <memory>

#include <base/logging.h>
#include <brillo/any.h>
#include <brillo/dbus/dbus_method_invoker.h>
#include <brillo/errors/error.h>
#include <dbus/message.h>
#include <dbus/object_proxy.h>

#include "btserial/dbus_constants.h"

namespace btserial {

namespace {

// Logs a failed call; |response| is null exactly when the call failed.
bool CheckResponse(const std::unique_ptr<dbus::Response>& response,
                   const brillo::ErrorPtr& error,
                   const std::string& method) {
  if (response)
    return true;
  LOG(ERROR) << method << " failed: "
             << (error ? error->GetMessage() : std::string("no reply"));
  return false;
}

}  // namespace

BluezClientImpl::BluezClientImpl(const scoped_refptr<dbus::Bus>& bus)
    : bus_(bus),
      bluez_proxy_(bus_->GetObjectProxy(kBluezServiceName,
                                        dbus::ObjectPath(kBluezRootPath))) {
  CHECK(bluez_proxy_);
}

bool BluezClientImpl::RegisterAgent(const dbus::ObjectPath& agent_path,
                                    const std::string& capability) {
  brillo::ErrorPtr error;
  auto response = brillo::dbus_utils::CallMethodAndBlock(
      bluez_proxy_, kAgentManagerInterface, kRegisterAgentMethod, &error,
      agent_path, capability);
  return CheckResponse(response, error, kRegisterAgentMethod);
}

bool BluezClientImpl::RequestDefaultAgent(const dbus::ObjectPath& agent_path) {
  brillo::ErrorPtr error;
  auto response = brillo::dbus_utils::CallMethodAndBlock(
      bluez_proxy_, kAgentManagerInterface, kRequestDefaultAgentMethod,
      &error, agent_path);
  return CheckResponse(response, error, kRequestDefaultAgentMethod);
}

bool BluezClientImpl::UnregisterAgent(const dbus::ObjectPath& agent_path) {
  brillo::ErrorPtr error;
  auto response = brillo::dbus_utils::CallMethodAndBlock(
      bluez_proxy_, kAgentManagerInterface, kUnregisterAgentMethod, &error,
      agent_path);
  return CheckResponse(response, error, kUnregisterAgentMethod);
}

bool BluezClientImpl::RegisterProfile(
    const dbus::ObjectPath& profile_path,
    const std::string& uuid,
    const brillo::VariantDictionary& options) {
  brillo::ErrorPtr error;
  auto response = brillo::dbus_utils::CallMethodAndBlock(
      bluez_proxy_, kProfileManagerInterface, kRegisterProfileMethod, &error,
      profile_path, uuid, options);
  return CheckResponse(response, error, kRegisterProfileMethod);
}

bool BluezClientImpl::UnregisterProfile(const dbus::ObjectPath& profile_path) {
  brillo::ErrorPtr error;
  auto response = brillo::dbus_utils::CallMethodAndBlock(
      bluez_proxy_, kProfileManagerInterface, kUnregisterProfileMethod,
      &error, profile_path);
  return CheckResponse(response, error, kUnregisterProfileMethod);
}

bool BluezClientImpl::SetTrusted(const dbus::ObjectPath& device_path) {
  dbus::ObjectProxy* device_proxy =
      bus_->GetObjectProxy(kBluezServiceName, device_path);
  brillo::ErrorPtr error;
  auto response = brillo::dbus_utils::CallMethodAndBlock(
      device_proxy, kPropertiesInterface, kPropertiesSetMethod, &error,
      std::string(kDeviceInterface), std::string(kDeviceTrustedProperty),
      brillo::Any(true));
  if (!CheckResponse(response, error, kDeviceTrustedProperty))
    return false;
  LOG(INFO) << "Device " << device_path.value() << " is trusted";
  return true;
}

}  // namespace btserial
