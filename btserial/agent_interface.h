// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BTSERIAL_AGENT_INTERFACE_H_
#define BTSERIAL_AGENT_INTERFACE_H_

#include <stdint.h>

#include <string>

#include <brillo/errors/error.h>
#include <dbus/object_path.h>

namespace btserial {

// The org.bluez.Agent1 callbacks, one method per callback kind. A method
// returning false must set |error|; its code becomes the D-Bus error name.
class AgentInterface {
 public:
  virtual ~AgentInterface() = default;

  virtual bool Release(brillo::ErrorPtr* error) = 0;
  virtual bool RequestPinCode(brillo::ErrorPtr* error,
                              const dbus::ObjectPath& device,
                              std::string* out_pin_code) = 0;
  virtual bool DisplayPinCode(brillo::ErrorPtr* error,
                              const dbus::ObjectPath& device,
                              const std::string& pin_code) = 0;
  virtual bool RequestPasskey(brillo::ErrorPtr* error,
                              const dbus::ObjectPath& device,
                              uint32_t* out_passkey) = 0;
  virtual bool DisplayPasskey(brillo::ErrorPtr* error,
                              const dbus::ObjectPath& device,
                              uint32_t passkey,
                              uint16_t entered) = 0;
  virtual bool RequestConfirmation(brillo::ErrorPtr* error,
                                   const dbus::ObjectPath& device,
                                   uint32_t passkey) = 0;
  virtual bool RequestAuthorization(brillo::ErrorPtr* error,
                                    const dbus::ObjectPath& device) = 0;
  virtual bool AuthorizeService(brillo::ErrorPtr* error,
                                const dbus::ObjectPath& device,
                                const std::string& uuid) = 0;
  virtual bool Cancel(brillo::ErrorPtr* error) = 0;
};

}  // namespace btserial

#endif  // BTSERIAL_AGENT_INTERFACE_H_
