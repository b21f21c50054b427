// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "btserial/radio_setup.h"

#include <vector>

#include <base/logging.h>
#include <base/strings/string_split.h>
#include <base/strings/string_util.h>

namespace btserial {

namespace {

constexpr char kHciconfig[] = "hciconfig";

constexpr char kPowerUp[] = "up";
constexpr char kDisableSsp[] = "sspmode 0";
constexpr char kPageAndInquiryScan[] = "piscan";

}  // namespace

RadioSetup::RadioSetup(CommandRunner* runner, const std::string& adapter)
    : runner_(runner), adapter_(adapter) {
  CHECK(runner_);
}

bool RadioSetup::BringUp() {
  for (const char* argument : {kPowerUp, kDisableSsp, kPageAndInquiryScan}) {
    if (!RunHciconfig(argument))
      return false;
  }
  LOG(INFO) << "Adapter " << adapter_ << " is up";
  return true;
}

bool RadioSetup::RunHciconfig(const std::string& argument) {
  std::vector<std::string> argv = {kHciconfig, adapter_};
  for (const auto& piece : base::SplitString(argument, " ",
                                             base::TRIM_WHITESPACE,
                                             base::SPLIT_WANT_NONEMPTY)) {
    argv.push_back(piece);
  }

  CommandResult result;
  if (!runner_->RunCommand(argv, &result))
    return false;

  if (result.exit_code != 0) {
    std::string err;
    base::TrimWhitespaceASCII(result.err, base::TRIM_ALL, &err);
    LOG(ERROR) << "'" << base::JoinString(argv, " ") << "' failed with "
               << result.exit_code << ": " << err;
    return false;
  }
  return true;
}

}  // namespace btserial
