// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "btserial/service_context.h"

#include <base/logging.h>

namespace btserial {

bool IsValidPinCode(const std::string& pin_code) {
  return pin_code.size() >= kMinPinCodeLength &&
         pin_code.size() <= kMaxPinCodeLength;
}

bool IsValidRfcommChannel(int channel) {
  return channel >= kMinRfcommChannel && channel <= kMaxRfcommChannel;
}

ServiceContext::ServiceContext(const ServiceOptions& options)
    : options_(options) {}

void ServiceContext::SetQuitClosure(const base::Closure& quit_closure) {
  quit_closure_ = quit_closure;
}

void ServiceContext::ClearQuitClosure() {
  quit_closure_.Reset();
}

void ServiceContext::RequestQuit() {
  if (quit_closure_.is_null()) {
    LOG(WARNING) << "Quit requested before the dispatch loop started";
    return;
  }
  LOG(INFO) << "Stopping the dispatch loop";
  quit_closure_.Run();
}

}  // namespace btserial
