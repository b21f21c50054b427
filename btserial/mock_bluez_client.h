// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BTSERIAL_MOCK_BLUEZ_CLIENT_H_
#define BTSERIAL_MOCK_BLUEZ_CLIENT_H_

#include <string>

#include <base/macros.h>
#include <gmock/gmock.h>

#include "btserial/bluez_client.h"

namespace btserial {

class MockBluezClient : public BluezClient {
 public:
  MockBluezClient() = default;
  ~MockBluezClient() override = default;

  MOCK_METHOD2(RegisterAgent,
               bool(const dbus::ObjectPath&, const std::string&));
  MOCK_METHOD1(RequestDefaultAgent, bool(const dbus::ObjectPath&));
  MOCK_METHOD1(UnregisterAgent, bool(const dbus::ObjectPath&));
  MOCK_METHOD3(RegisterProfile,
               bool(const dbus::ObjectPath&,
                    const std::string&,
                    const brillo::VariantDictionary&));
  MOCK_METHOD1(UnregisterProfile, bool(const dbus::ObjectPath&));
  MOCK_METHOD1(SetTrusted, bool(const dbus::ObjectPath&));

 private:
  DISALLOW_COPY_AND_ASSIGN(MockBluezClient);
};

}  // namespace btserial

#endif  // BTSERIAL_MOCK_BLUEZ_CLIENT_H_
