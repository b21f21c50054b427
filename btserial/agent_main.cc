// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include <memory>

#include <base/bind.h>
#include <base/command_line.h>
#include <base/files/file_path.h>
#include <base/logging.h>
#include <brillo/flag_helper.h>

#include "btserial/agent_daemon.h"
#include "btserial/service_lifecycle_manager.h"
#include "btserial/service_main.h"

namespace {

std::unique_ptr<btserial::ServiceDaemon> CreateAgentDaemon(
    btserial::ServiceContext* context) {
  return std::unique_ptr<btserial::ServiceDaemon>(
      new btserial::AgentDaemon(context));
}

}  // namespace

int main(int argc, char* argv[]) {
  DEFINE_bool(debug, false, "Stay in the foreground");
  DEFINE_bool(single, false,
              "Stay in the foreground and exit after the first device is "
              "authorized");
  DEFINE_string(pid_file, "/run/btserial/agent.pid", "Pid file location");
  DEFINE_string(adapter, btserial::kDefaultAdapter, "HCI adapter to bring up");
  DEFINE_string(pin_code, btserial::kDefaultPinCode,
                "Legacy PIN offered to every device (1 to 16 characters)");
  DEFINE_bool(log_to_stderr, false, "Log to both syslog and stderr");

  brillo::FlagHelper::Init(argc, argv,
                           "btserial pairing agent.\n\n"
                           "Usage: btserial_agent [flags] start|stop|restart");
  btserial::InitServiceLogging(FLAGS_log_to_stderr);

  if (!btserial::IsValidPinCode(FLAGS_pin_code)) {
    LOG(ERROR) << "PIN code must be " << btserial::kMinPinCodeLength << " to "
               << btserial::kMaxPinCodeLength << " characters long";
    return btserial::kExitFailure;
  }
  if (FLAGS_pid_file.empty() || FLAGS_adapter.empty()) {
    LOG(ERROR) << "--pid_file and --adapter must not be empty";
    return btserial::kExitFailure;
  }

  btserial::ServiceOptions options;
  options.pid_file = base::FilePath(FLAGS_pid_file);
  options.debug = FLAGS_debug;
  options.single = FLAGS_single;
  options.adapter = FLAGS_adapter;
  options.pin_code = FLAGS_pin_code;

  return btserial::RunServiceAction(
      options, base::CommandLine::ForCurrentProcess()->GetArgs(),
      base::Bind(&CreateAgentDaemon));
}
