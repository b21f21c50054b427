// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BTSERIAL_PAIRING_AGENT_H_
#define BTSERIAL_PAIRING_AGENT_H_

#include <stdint.h>

#include <string>

#include <base/macros.h>

#include "btserial/agent_interface.h"
#include "btserial/bluez_client.h"
#include "btserial/service_context.h"

namespace btserial {

// Message carried by the errors that refuse passkey based pairing.
extern const char kPinOnlyPairingMessage[];

// Pairing agent that only supports legacy PIN entry. Every call is answered
// from its arguments and the configured PIN alone; nothing is remembered
// between calls. Passkey and confirmation requests are canceled so that the
// remote stack falls back to the PIN flow.
class PairingAgent : public AgentInterface {
 public:
  // |context| and |bluez_client| must outlive this object.
  PairingAgent(ServiceContext* context, BluezClient* bluez_client);
  ~PairingAgent() override = default;

  // AgentInterface overrides:
  bool Release(brillo::ErrorPtr* error) override;
  bool RequestPinCode(brillo::ErrorPtr* error,
                      const dbus::ObjectPath& device,
                      std::string* out_pin_code) override;
  bool DisplayPinCode(brillo::ErrorPtr* error,
                      const dbus::ObjectPath& device,
                      const std::string& pin_code) override;
  bool RequestPasskey(brillo::ErrorPtr* error,
                      const dbus::ObjectPath& device,
                      uint32_t* out_passkey) override;
  bool DisplayPasskey(brillo::ErrorPtr* error,
                      const dbus::ObjectPath& device,
                      uint32_t passkey,
                      uint16_t entered) override;
  bool RequestConfirmation(brillo::ErrorPtr* error,
                           const dbus::ObjectPath& device,
                           uint32_t passkey) override;
  bool RequestAuthorization(brillo::ErrorPtr* error,
                            const dbus::ObjectPath& device) override;
  bool AuthorizeService(brillo::ErrorPtr* error,
                        const dbus::ObjectPath& device,
                        const std::string& uuid) override;
  bool Cancel(brillo::ErrorPtr* error) override;

 private:
  ServiceContext* context_;
  BluezClient* bluez_client_;

  DISALLOW_COPY_AND_ASSIGN(PairingAgent);
};

}  // namespace btserial

#endif  // BTSERIAL_PAIRING_AGENT_H_
