// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BTSERIAL_PROFILE_DAEMON_H_
#define BTSERIAL_PROFILE_DAEMON_H_

#include <stdint.h>

#include <memory>

#include <base/macros.h>
#include <brillo/variant_dictionary.h>

#include "btserial/connection_handler.h"
#include "btserial/profile_dbus_adaptor.h"
#include "btserial/service_daemon.h"

namespace btserial {

// Builds the RegisterProfile options for the serial port profile on
// |channel|.
brillo::VariantDictionary GetSerialPortProfileOptions(uint16_t channel);

// Daemon serving the serial port profile.
class ProfileDaemon : public ServiceDaemon {
 public:
  explicit ProfileDaemon(ServiceContext* context);
  ~ProfileDaemon() override;

 protected:
  // ServiceDaemon overrides.
  bool RegisterService(dbus::ExportedObject* exported_object,
                       BluezClient* bluez_client) override;
  void UnregisterService(BluezClient* bluez_client) override;

 private:
  ConnectionHandler connection_handler_;
  std::unique_ptr<ProfileDBusAdaptor> adaptor_;

  DISALLOW_COPY_AND_ASSIGN(ProfileDaemon);
};

}  // namespace btserial

#endif  // BTSERIAL_PROFILE_DAEMON_H_
