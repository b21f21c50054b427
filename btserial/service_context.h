// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BTSERIAL_SERVICE_CONTEXT_H_
#define BTSERIAL_SERVICE_CONTEXT_H_

#include <stdint.h>

#include <string>

#include <base/callback.h>
#include <base/files/file_path.h>
#include <base/macros.h>

namespace btserial {

constexpr char kDefaultAdapter[] = "hci0";
constexpr char kDefaultPinCode[] = "1234";
constexpr uint16_t kDefaultRfcommChannel = 1;

constexpr size_t kMinPinCodeLength = 1;
constexpr size_t kMaxPinCodeLength = 16;
constexpr uint16_t kMinRfcommChannel = 1;
constexpr uint16_t kMaxRfcommChannel = 30;

// Settings of one daemon instance, filled from the command line.
struct ServiceOptions {
  base::FilePath pid_file;
  // Stay in the foreground.
  bool debug = false;
  // Quit after the first successful authorization (pairing agent only).
  bool single = false;
  std::string adapter = kDefaultAdapter;
  std::string pin_code = kDefaultPinCode;
  uint16_t channel = kDefaultRfcommChannel;
};

// Returns true if |pin_code| is usable as a legacy PIN.
bool IsValidPinCode(const std::string& pin_code);

// Returns true if |channel| is a valid RFCOMM server channel.
bool IsValidRfcommChannel(int channel);

// State shared by the lifecycle manager, the pairing agent and the
// connection handler of one process.
class ServiceContext {
 public:
  explicit ServiceContext(const ServiceOptions& options);
  ~ServiceContext() = default;

  const ServiceOptions& options() const { return options_; }

  // Installed by the daemon once its message loop runs.
  void SetQuitClosure(const base::Closure& quit_closure);
  void ClearQuitClosure();

  // Asks the dispatch loop to finish.
  void RequestQuit();

 private:
  const ServiceOptions options_;
  base::Closure quit_closure_;

  DISALLOW_COPY_AND_ASSIGN(ServiceContext);
};

}  // namespace btserial

#endif  // BTSERIAL_SERVICE_CONTEXT_H_
