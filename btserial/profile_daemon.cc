// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "btserial/profile_daemon.h"

#include <string>

#include <base/logging.h>

#include "btserial/dbus_constants.h"

namespace btserial {

brillo::VariantDictionary GetSerialPortProfileOptions(uint16_t channel) {
  brillo::VariantDictionary options;
  options[kProfileOptionAutoConnect] = true;
  options[kProfileOptionName] = std::string(kSerialPortName);
  options[kProfileOptionRole] = std::string(kProfileRoleServer);
  options[kProfileOptionChannel] = channel;
  options[kProfileOptionService] = std::string(kSerialPortUuid);
  return options;
}

ProfileDaemon::ProfileDaemon(ServiceContext* context)
    : ServiceDaemon(context, dbus::ObjectPath(kProfileObjectPath)) {}

ProfileDaemon::~ProfileDaemon() = default;

bool ProfileDaemon::RegisterService(dbus::ExportedObject* exported_object,
                                    BluezClient* bluez_client) {
  adaptor_.reset(new ProfileDBusAdaptor(&connection_handler_));
  adaptor_->ExportDBusMethods(exported_object);

  uint16_t channel = context()->options().channel;
  if (!bluez_client->RegisterProfile(object_path(), kSerialPortUuid,
                                     GetSerialPortProfileOptions(channel))) {
    return false;
  }
  LOG(INFO) << "Registered serial port profile on RFCOMM channel " << channel;
  return true;
}

void ProfileDaemon::UnregisterService(BluezClient* bluez_client) {
  if (!bluez_client->UnregisterProfile(object_path()))
    LOG(WARNING) << "Failed to unregister profile";
}

}  // namespace btserial
