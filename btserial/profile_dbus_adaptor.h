// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BTSERIAL_PROFILE_DBUS_ADAPTOR_H_
#define BTSERIAL_PROFILE_DBUS_ADAPTOR_H_

#include <memory>
#include <string>

#include <base/macros.h>
#include <dbus/exported_object.h>

namespace dbus {
class MethodCall;
class Response;
}  // namespace dbus

namespace btserial {

class ConnectionHandler;

// Serves org.bluez.Profile1 for the serial port profile. NewConnection hands
// the RFCOMM socket to the ConnectionHandler, answers BlueZ and then keeps
// the dispatch thread busy until the session is over.
class ProfileDBusAdaptor {
 public:
  // |handler| must outlive this object.
  explicit ProfileDBusAdaptor(ConnectionHandler* handler);
  ~ProfileDBusAdaptor();

  void ExportDBusMethods(dbus::ExportedObject* object);

  std::unique_ptr<dbus::Response> Release(dbus::MethodCall* call);
  void NewConnection(dbus::MethodCall* call,
                     dbus::ExportedObject::ResponseSender response_sender);
  std::unique_ptr<dbus::Response> RequestDisconnection(dbus::MethodCall* call);

 private:
  typedef std::unique_ptr<dbus::Response> (
      ProfileDBusAdaptor::*SyncDBusMethodCallMemberFunction)(dbus::MethodCall*);
  typedef void (ProfileDBusAdaptor::*AsyncDBusMethodCallMemberFunction)(
      dbus::MethodCall*, dbus::ExportedObject::ResponseSender);

  void ExportSyncDBusMethod(dbus::ExportedObject* object,
                            const std::string& method_name,
                            SyncDBusMethodCallMemberFunction member);
  void ExportAsyncDBusMethod(dbus::ExportedObject* object,
                             const std::string& method_name,
                             AsyncDBusMethodCallMemberFunction member);

  ConnectionHandler* const handler_;  // Not owned.

  DISALLOW_COPY_AND_ASSIGN(ProfileDBusAdaptor);
};

}  // namespace btserial

#endif  // BTSERIAL_PROFILE_DBUS_ADAPTOR_H_
