// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BTSERIAL_SERVICE_MAIN_H_
#define BTSERIAL_SERVICE_MAIN_H_

#include <memory>
#include <string>
#include <vector>

#include <base/callback.h>

#include "btserial/service_context.h"
#include "btserial/service_daemon.h"

namespace btserial {

using DaemonFactory =
    base::Callback<std::unique_ptr<ServiceDaemon>(ServiceContext*)>;

// Sets up logging for a btserial daemon.
void InitServiceLogging(bool log_to_stderr);

// Runs the lifecycle action named by the single positional argument in
// |args|. The daemon is only created once the process has detached.
// Returns the process exit code.
int RunServiceAction(const ServiceOptions& options,
                     const std::vector<std::string>& args,
                     const DaemonFactory& daemon_factory);

}  // namespace btserial

#endif  // BTSERIAL_SERVICE_MAIN_H_
