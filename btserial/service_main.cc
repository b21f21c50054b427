// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "btserial/service_main.h"

#include <sysexits.h>

#include <base/bind.h>
#include <base/logging.h>
#include <brillo/syslog_logging.h>

#include "btserial/daemonize_strategy.h"
#include "btserial/process_utils.h"
#include "btserial/service_lifecycle_manager.h"

namespace btserial {

namespace {

int RunDaemon(const DaemonFactory& daemon_factory, ServiceContext* context) {
  std::unique_ptr<ServiceDaemon> daemon = daemon_factory.Run(context);
  int exit_code = daemon->Run();
  if (exit_code != EX_OK) {
    LOG(ERROR) << "Daemon exited with " << exit_code;
    return kExitFailure;
  }
  return kExitSuccess;
}

}  // namespace

void InitServiceLogging(bool log_to_stderr) {
  int flags = brillo::kLogToSyslog | brillo::kLogToStderrIfTty;
  if (log_to_stderr)
    flags |= brillo::kLogToStderr;
  brillo::InitLog(flags);
}

int RunServiceAction(const ServiceOptions& options,
                     const std::vector<std::string>& args,
                     const DaemonFactory& daemon_factory) {
  if (args.size() != 1) {
    LOG(ERROR) << "Expected exactly one action: start, stop or restart";
    return kExitUnknownAction;
  }
  base::Optional<LifecycleAction> action = ParseLifecycleAction(args[0]);
  if (!action) {
    LOG(ERROR) << "Unknown action '" << args[0] << "'";
    return kExitUnknownAction;
  }

  ServiceContext context(options);
  ProcessUtilsImpl process_utils;
  ForkDaemonizeStrategy daemonize_strategy;
  ServiceLifecycleManager manager(
      &context, &process_utils, &daemonize_strategy,
      base::Bind(&RunDaemon, daemon_factory, &context));
  return manager.Perform(action.value());
}

}  // namespace btserial
