// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.
//
// Calls made by btserial into BlueZ over the system bus.

#ifndef BTSERIAL_BLUEZ_CLIENT_H_
#define BTSERIAL_BLUEZ_CLIENT_H_

#include <string>

#include <base/macros.h>
#include <base/memory/ref_counted.h>
#include <brillo/variant_dictionary.h>
#include <dbus/bus.h>
#include <dbus/object_path.h>

namespace btserial {

class BluezClient {
 public:
  virtual ~BluezClient() = default;

  // org.bluez.AgentManager1.
  virtual bool RegisterAgent(const dbus::ObjectPath& agent_path,
                             const std::string& capability) = 0;
  virtual bool RequestDefaultAgent(const dbus::ObjectPath& agent_path) = 0;
  virtual bool UnregisterAgent(const dbus::ObjectPath& agent_path) = 0;

  // org.bluez.ProfileManager1.
  virtual bool RegisterProfile(const dbus::ObjectPath& profile_path,
                               const std::string& uuid,
                               const brillo::VariantDictionary& options) = 0;
  virtual bool UnregisterProfile(const dbus::ObjectPath& profile_path) = 0;

  // Sets org.bluez.Device1.Trusted to true. Trust is never revoked here.
  virtual bool SetTrusted(const dbus::ObjectPath& device_path) = 0;
};

class BluezClientImpl : public BluezClient {
 public:
  explicit BluezClientImpl(const scoped_refptr<dbus::Bus>& bus);
  ~BluezClientImpl() override = default;

  bool RegisterAgent(const dbus::ObjectPath& agent_path,
                     const std::string& capability) override;
  bool RequestDefaultAgent(const dbus::ObjectPath& agent_path) override;
  bool UnregisterAgent(const dbus::ObjectPath& agent_path) override;
  bool RegisterProfile(const dbus::ObjectPath& profile_path,
                       const std::string& uuid,
                       const brillo::VariantDictionary& options) override;
  bool UnregisterProfile(const dbus::ObjectPath& profile_path) override;
  bool SetTrusted(const dbus::ObjectPath& device_path) override;

 private:
  scoped_refptr<dbus::Bus> bus_;
  // Proxy of /org/bluez, owned by |bus_|.
  dbus::ObjectProxy* bluez_proxy_;

  DISALLOW_COPY_AND_ASSIGN(BluezClientImpl);
};

}  // namespace btserial

#endif  // BTSERIAL_BLUEZ_CLIENT_H_
