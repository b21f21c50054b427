// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "btserial/pairing_agent.h"

#include <base/location.h>
#include <base/logging.h>
#include <brillo/errors/error_codes.h>

#include "btserial/dbus_constants.h"

namespace btserial {

const char kPinOnlyPairingMessage[] = "PIN-only pairing";

namespace {

constexpr char kTrustFailedMessage[] = "Failed to trust device";

void SetBluezError(brillo::ErrorPtr* error,
                   const base::Location& location,
                   const std::string& error_name,
                   const std::string& message) {
  brillo::Error::AddTo(error, location, brillo::errors::dbus::kDomain,
                       error_name, message);
}

}  // namespace

PairingAgent::PairingAgent(ServiceContext* context, BluezClient* bluez_client)
    : context_(context), bluez_client_(bluez_client) {
  CHECK(context_);
  CHECK(bluez_client_);
}

bool PairingAgent::Release(brillo::ErrorPtr* error) {
  LOG(INFO) << "Agent released by BlueZ";
  return true;
}

bool PairingAgent::RequestPinCode(brillo::ErrorPtr* error,
                                  const dbus::ObjectPath& device,
                                  std::string* out_pin_code) {
  LOG(INFO) << "RequestPinCode for " << device.value();
  *out_pin_code = context_->options().pin_code;
  return true;
}

bool PairingAgent::DisplayPinCode(brillo::ErrorPtr* error,
                                  const dbus::ObjectPath& device,
                                  const std::string& pin_code) {
  LOG(INFO) << "DisplayPinCode for " << device.value() << ": " << pin_code;
  return true;
}

bool PairingAgent::RequestPasskey(brillo::ErrorPtr* error,
                                  const dbus::ObjectPath& device,
                                  uint32_t* out_passkey) {
  LOG(INFO) << "Canceling RequestPasskey for " << device.value();
  SetBluezError(error, FROM_HERE, bluez_error::kCanceled,
                kPinOnlyPairingMessage);
  return false;
}

bool PairingAgent::DisplayPasskey(brillo::ErrorPtr* error,
                                  const dbus::ObjectPath& device,
                                  uint32_t passkey,
                                  uint16_t entered) {
  LOG(INFO) << "DisplayPasskey for " << device.value() << ": " << passkey
            << " (" << entered << " entered)";
  return true;
}

bool PairingAgent::RequestConfirmation(brillo::ErrorPtr* error,
                                       const dbus::ObjectPath& device,
                                       uint32_t passkey) {
  LOG(INFO) << "Canceling RequestConfirmation of " << passkey << " for "
            << device.value();
  SetBluezError(error, FROM_HERE, bluez_error::kCanceled,
                kPinOnlyPairingMessage);
  return false;
}

bool PairingAgent::RequestAuthorization(brillo::ErrorPtr* error,
                                        const dbus::ObjectPath& device) {
  LOG(INFO) << "RequestAuthorization for " << device.value();
  return true;
}

bool PairingAgent::AuthorizeService(brillo::ErrorPtr* error,
                                    const dbus::ObjectPath& device,
                                    const std::string& uuid) {
  // BlueZ only asks once the device has passed PIN verification.
  LOG(INFO) << "AuthorizeService " << uuid << " for " << device.value();
  if (!bluez_client_->SetTrusted(device)) {
    SetBluezError(error, FROM_HERE, bluez_error::kRejected,
                  kTrustFailedMessage);
    return false;
  }

  if (context_->options().single)
    context_->RequestQuit();
  return true;
}

bool PairingAgent::Cancel(brillo::ErrorPtr* error) {
  LOG(INFO) << "Pairing canceled by BlueZ";
  return true;
}

}  // namespace btserial
