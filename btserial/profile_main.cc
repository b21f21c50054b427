// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include <stdint.h>

#include <memory>

#include <base/bind.h>
#include <base/command_line.h>
#include <base/files/file_path.h>
#include <base/logging.h>
#include <brillo/flag_helper.h>

#include "btserial/profile_daemon.h"
#include "btserial/service_lifecycle_manager.h"
#include "btserial/service_main.h"

namespace {

std::unique_ptr<btserial::ServiceDaemon> CreateProfileDaemon(
    btserial::ServiceContext* context) {
  return std::unique_ptr<btserial::ServiceDaemon>(
      new btserial::ProfileDaemon(context));
}

}  // namespace

int main(int argc, char* argv[]) {
  DEFINE_bool(debug, false, "Stay in the foreground");
  DEFINE_string(pid_file, "/run/btserial/profile.pid", "Pid file location");
  DEFINE_string(adapter, btserial::kDefaultAdapter, "HCI adapter to bring up");
  DEFINE_int32(channel, btserial::kDefaultRfcommChannel,
               "RFCOMM channel of the serial port (1 to 30)");
  DEFINE_bool(log_to_stderr, false, "Log to both syslog and stderr");

  brillo::FlagHelper::Init(
      argc, argv,
      "btserial serial port profile.\n\n"
      "Usage: btserial_profile [flags] start|stop|restart");
  btserial::InitServiceLogging(FLAGS_log_to_stderr);

  if (!btserial::IsValidRfcommChannel(FLAGS_channel)) {
    LOG(ERROR) << "RFCOMM channel must be between "
               << btserial::kMinRfcommChannel << " and "
               << btserial::kMaxRfcommChannel;
    return btserial::kExitFailure;
  }
  if (FLAGS_pid_file.empty() || FLAGS_adapter.empty()) {
    LOG(ERROR) << "--pid_file and --adapter must not be empty";
    return btserial::kExitFailure;
  }

  btserial::ServiceOptions options;
  options.pid_file = base::FilePath(FLAGS_pid_file);
  options.debug = FLAGS_debug;
  options.adapter = FLAGS_adapter;
  options.channel = static_cast<uint16_t>(FLAGS_channel);

  return btserial::RunServiceAction(
      options, base::CommandLine::ForCurrentProcess()->GetArgs(),
      base::Bind(&CreateProfileDaemon));
}
