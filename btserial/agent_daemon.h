// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BTSERIAL_AGENT_DAEMON_H_
#define BTSERIAL_AGENT_DAEMON_H_

#include <memory>

#include <base/macros.h>

#include "btserial/agent_dbus_adaptor.h"
#include "btserial/pairing_agent.h"
#include "btserial/service_daemon.h"

namespace btserial {

// Daemon serving the PIN pairing agent as the default BlueZ agent.
class AgentDaemon : public ServiceDaemon {
 public:
  explicit AgentDaemon(ServiceContext* context);
  ~AgentDaemon() override;

 protected:
  // ServiceDaemon overrides.
  bool RegisterService(dbus::ExportedObject* exported_object,
                       BluezClient* bluez_client) override;
  void UnregisterService(BluezClient* bluez_client) override;

 private:
  std::unique_ptr<PairingAgent> agent_;
  std::unique_ptr<AgentDBusAdaptor> adaptor_;

  DISALLOW_COPY_AND_ASSIGN(AgentDaemon);
};

}  // namespace btserial

#endif  // BTSERIAL_AGENT_DAEMON_H_
