// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "btserial/service_daemon.h"

#include <signal.h>
#include <sysexits.h>

#include <base/bind.h>
#include <base/logging.h>

#include "btserial/radio_setup.h"

namespace btserial {

ServiceDaemon::ServiceDaemon(ServiceContext* context,
                             const dbus::ObjectPath& object_path)
    : context_(context), object_path_(object_path) {
  DCHECK(context_);
}

ServiceDaemon::~ServiceDaemon() = default;

int ServiceDaemon::OnInit() {
  int exit_code = brillo::DBusDaemon::OnInit();
  if (exit_code != EX_OK)
    return exit_code;

  // Writes to a socket the peer already closed must fail with EPIPE.
  if (signal(SIGPIPE, SIG_IGN) == SIG_ERR)
    PLOG(WARNING) << "Failed to ignore SIGPIPE";

  RadioSetup radio_setup(&command_runner_, context_->options().adapter);
  if (!radio_setup.BringUp()) {
    LOG(WARNING) << "Radio bring-up of " << context_->options().adapter
                 << " failed, continuing with the current radio state";
  }

  bluez_client_.reset(new BluezClientImpl(bus_));
  dbus::ExportedObject* exported_object = bus_->GetExportedObject(object_path_);
  CHECK(exported_object);
  if (!RegisterService(exported_object, bluez_client_.get())) {
    LOG(ERROR) << "Failed to register " << object_path_.value()
               << " with BlueZ";
    return EX_UNAVAILABLE;
  }
  registered_ = true;

  context_->SetQuitClosure(
      base::Bind(&brillo::Daemon::Quit, base::Unretained(this)));
  LOG(INFO) << "Serving " << object_path_.value();
  return EX_OK;
}

void ServiceDaemon::OnShutdown(int* return_code) {
  context_->ClearQuitClosure();
  if (registered_) {
    UnregisterService(bluez_client_.get());
    registered_ = false;
  }
  brillo::DBusDaemon::OnShutdown(return_code);
}

}  // namespace btserial
