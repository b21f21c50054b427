// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BTSERIAL_RADIO_SETUP_H_
#define BTSERIAL_RADIO_SETUP_H_

#include <string>

#include <base/macros.h>

#include "btserial/command_runner.h"

namespace btserial {

// Puts the local adapter into the mode both daemons expect: powered,
// connectable and discoverable, with Secure Simple Pairing disabled so that
// remote devices fall back to legacy PIN pairing.
class RadioSetup {
 public:
  // |runner| must outlive this object.
  RadioSetup(CommandRunner* runner, const std::string& adapter);
  ~RadioSetup() = default;

  // Returns false at the first command that fails.
  bool BringUp();

 private:
  bool RunHciconfig(const std::string& argument);

  CommandRunner* runner_;
  const std::string adapter_;

  DISALLOW_COPY_AND_ASSIGN(RadioSetup);
};

}  // namespace btserial

#endif  // BTSERIAL_RADIO_SETUP_H_
