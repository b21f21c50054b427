// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "btserial/service_context.h"

#include <base/bind.h>
#include <gtest/gtest.h>

namespace btserial {

namespace {

void Increment(int* counter) {
  (*counter)++;
}

}  // namespace

TEST(ServiceContextTest, ValidatesPinCode) {
  EXPECT_TRUE(IsValidPinCode("0"));
  EXPECT_TRUE(IsValidPinCode(kDefaultPinCode));
  EXPECT_TRUE(IsValidPinCode("0123456789abcdef"));
  EXPECT_FALSE(IsValidPinCode(""));
  EXPECT_FALSE(IsValidPinCode("0123456789abcdef0"));
}

TEST(ServiceContextTest, ValidatesRfcommChannel) {
  EXPECT_TRUE(IsValidRfcommChannel(1));
  EXPECT_TRUE(IsValidRfcommChannel(30));
  EXPECT_FALSE(IsValidRfcommChannel(0));
  EXPECT_FALSE(IsValidRfcommChannel(31));
  EXPECT_FALSE(IsValidRfcommChannel(-1));
}

TEST(ServiceContextTest, Defaults) {
  ServiceOptions options;
  EXPECT_FALSE(options.debug);
  EXPECT_FALSE(options.single);
  EXPECT_EQ("hci0", options.adapter);
  EXPECT_EQ("1234", options.pin_code);
  EXPECT_EQ(1, options.channel);
}

TEST(ServiceContextTest, RequestQuitRunsInstalledClosure) {
  ServiceContext context{ServiceOptions()};
  int quit_count = 0;

  // Nothing installed yet.
  context.RequestQuit();
  EXPECT_EQ(0, quit_count);

  context.SetQuitClosure(base::Bind(&Increment, &quit_count));
  context.RequestQuit();
  EXPECT_EQ(1, quit_count);

  context.ClearQuitClosure();
  context.RequestQuit();
  EXPECT_EQ(1, quit_count);
}

}  // namespace btserial
