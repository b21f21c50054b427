// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "btserial/agent_daemon.h"

#include <base/logging.h>

#include "btserial/dbus_constants.h"

namespace btserial {

AgentDaemon::AgentDaemon(ServiceContext* context)
    : ServiceDaemon(context, dbus::ObjectPath(kAgentObjectPath)) {}

AgentDaemon::~AgentDaemon() = default;

bool AgentDaemon::RegisterService(dbus::ExportedObject* exported_object,
                                  BluezClient* bluez_client) {
  agent_.reset(new PairingAgent(context(), bluez_client));
  adaptor_.reset(new AgentDBusAdaptor(agent_.get()));
  adaptor_->ExportDBusMethods(exported_object);

  if (!bluez_client->RegisterAgent(object_path(),
                                   kAgentCapabilityKeyboardDisplay)) {
    return false;
  }
  if (!bluez_client->RequestDefaultAgent(object_path())) {
    if (!bluez_client->UnregisterAgent(object_path()))
      LOG(WARNING) << "Failed to roll back agent registration";
    return false;
  }

  LOG(INFO) << "Registered default agent with PIN-only pairing"
            << (context()->options().single ? " (single)" : "");
  return true;
}

void AgentDaemon::UnregisterService(BluezClient* bluez_client) {
  if (!bluez_client->UnregisterAgent(object_path()))
    LOG(WARNING) << "Failed to unregister agent";
}

}  // namespace btserial
