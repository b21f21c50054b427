// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BTSERIAL_SERVICE_DAEMON_H_
#define BTSERIAL_SERVICE_DAEMON_H_

#include <memory>

#include <base/macros.h>
#include <brillo/daemons/dbus_daemon.h>
#include <dbus/exported_object.h>
#include <dbus/object_path.h>

#include "btserial/bluez_client.h"
#include "btserial/command_runner.h"
#include "btserial/service_context.h"

namespace btserial {

// Common startup and shutdown of the btserial daemons: brings the radio up,
// exports the service object, registers it with BlueZ and hooks the message
// loop up to ServiceContext::RequestQuit().
class ServiceDaemon : public brillo::DBusDaemon {
 public:
  // |context| must outlive this object.
  ServiceDaemon(ServiceContext* context, const dbus::ObjectPath& object_path);
  ~ServiceDaemon() override;

 protected:
  // brillo::Daemon overrides.
  int OnInit() override;
  void OnShutdown(int* return_code) override;

  // Exports the service methods on |exported_object| and registers the
  // service with BlueZ.
  virtual bool RegisterService(dbus::ExportedObject* exported_object,
                               BluezClient* bluez_client) = 0;
  virtual void UnregisterService(BluezClient* bluez_client) = 0;

  ServiceContext* context() const { return context_; }
  const dbus::ObjectPath& object_path() const { return object_path_; }

 private:
  ServiceContext* context_;  // Not owned.
  const dbus::ObjectPath object_path_;
  CommandRunnerImpl command_runner_;
  std::unique_ptr<BluezClient> bluez_client_;
  bool registered_ = false;

  DISALLOW_COPY_AND_ASSIGN(ServiceDaemon);
};

}  // namespace btserial

#endif  // BTSERIAL_SERVICE_DAEMON_H_
