// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BTSERIAL_DBUS_CONSTANTS_H_
#define BTSERIAL_DBUS_CONSTANTS_H_

namespace btserial {

// Objects exported by btserial.
constexpr char kAgentObjectPath[] = "/org/btserial/agent";
constexpr char kProfileObjectPath[] = "/org/btserial/profile";

// BlueZ service.
constexpr char kBluezServiceName[] = "org.bluez";
constexpr char kBluezRootPath[] = "/org/bluez";

constexpr char kAgentManagerInterface[] = "org.bluez.AgentManager1";
constexpr char kRegisterAgentMethod[] = "RegisterAgent";
constexpr char kRequestDefaultAgentMethod[] = "RequestDefaultAgent";
constexpr char kUnregisterAgentMethod[] = "UnregisterAgent";

constexpr char kProfileManagerInterface[] = "org.bluez.ProfileManager1";
constexpr char kRegisterProfileMethod[] = "RegisterProfile";
constexpr char kUnregisterProfileMethod[] = "UnregisterProfile";

constexpr char kDeviceInterface[] = "org.bluez.Device1";
constexpr char kDeviceTrustedProperty[] = "Trusted";

constexpr char kPropertiesInterface[] = "org.freedesktop.DBus.Properties";
constexpr char kPropertiesSetMethod[] = "Set";

// org.bluez.Agent1, implemented by the pairing agent.
constexpr char kAgentInterface[] = "org.bluez.Agent1";
constexpr char kAgentReleaseMethod[] = "Release";
constexpr char kAgentRequestPinCodeMethod[] = "RequestPinCode";
constexpr char kAgentDisplayPinCodeMethod[] = "DisplayPinCode";
constexpr char kAgentRequestPasskeyMethod[] = "RequestPasskey";
constexpr char kAgentDisplayPasskeyMethod[] = "DisplayPasskey";
constexpr char kAgentRequestConfirmationMethod[] = "RequestConfirmation";
constexpr char kAgentRequestAuthorizationMethod[] = "RequestAuthorization";
constexpr char kAgentAuthorizeServiceMethod[] = "AuthorizeService";
constexpr char kAgentCancelMethod[] = "Cancel";

constexpr char kAgentCapabilityKeyboardDisplay[] = "KeyboardDisplay";

// org.bluez.Profile1, implemented by the serial profile.
constexpr char kProfileInterface[] = "org.bluez.Profile1";
constexpr char kProfileReleaseMethod[] = "Release";
constexpr char kProfileNewConnectionMethod[] = "NewConnection";
constexpr char kProfileRequestDisconnectionMethod[] = "RequestDisconnection";

// RegisterProfile option keys.
constexpr char kProfileOptionAutoConnect[] = "AutoConnect";
constexpr char kProfileOptionName[] = "Name";
constexpr char kProfileOptionRole[] = "Role";
constexpr char kProfileOptionChannel[] = "Channel";
constexpr char kProfileOptionService[] = "Service";

constexpr char kSerialPortUuid[] = "00001101-0000-1000-8000-00805f9b34fb";
constexpr char kSerialPortName[] = "Serial Port";
constexpr char kProfileRoleServer[] = "server";

namespace bluez_error {

constexpr char kCanceled[] = "org.bluez.Error.Canceled";
constexpr char kRejected[] = "org.bluez.Error.Rejected";

}  // namespace bluez_error

}  // namespace btserial

#endif  // BTSERIAL_DBUS_CONSTANTS_H_
