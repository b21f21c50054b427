// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "btserial/profile_daemon.h"

#include <stdint.h>

#include <string>

#include <gtest/gtest.h>

#include "btserial/dbus_constants.h"

namespace btserial {

TEST(ProfileDaemonTest, SerialPortProfileOptions) {
  brillo::VariantDictionary options = GetSerialPortProfileOptions(3);

  EXPECT_EQ(5u, options.size());
  EXPECT_TRUE(brillo::GetVariantValueOrDefault<bool>(
      options, kProfileOptionAutoConnect));
  EXPECT_EQ("Serial Port", brillo::GetVariantValueOrDefault<std::string>(
                               options, kProfileOptionName));
  EXPECT_EQ("server", brillo::GetVariantValueOrDefault<std::string>(
                          options, kProfileOptionRole));
  EXPECT_EQ(3, brillo::GetVariantValueOrDefault<uint16_t>(
                   options, kProfileOptionChannel));
  EXPECT_EQ("00001101-0000-1000-8000-00805f9b34fb",
            brillo::GetVariantValueOrDefault<std::string>(
                options, kProfileOptionService));
}

}  // namespace btserial
