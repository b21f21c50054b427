// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BTSERIAL_AGENT_DBUS_ADAPTOR_H_
#define BTSERIAL_AGENT_DBUS_ADAPTOR_H_

#include <memory>
#include <string>

#include <base/macros.h>
#include <dbus/exported_object.h>

namespace dbus {
class MethodCall;
class Response;
}  // namespace dbus

namespace btserial {

class AgentInterface;

// Translates org.bluez.Agent1 method calls into AgentInterface calls and the
// results back into D-Bus replies. Failures reported by the agent are sent
// as D-Bus errors named after the brillo::Error code.
class AgentDBusAdaptor {
 public:
  // |impl| must outlive this object.
  explicit AgentDBusAdaptor(AgentInterface* impl);
  ~AgentDBusAdaptor();

  // Exports every Agent1 method on |object|. Blocks until each export
  // completes.
  void ExportDBusMethods(dbus::ExportedObject* object);

  std::unique_ptr<dbus::Response> Release(dbus::MethodCall* call);
  std::unique_ptr<dbus::Response> RequestPinCode(dbus::MethodCall* call);
  std::unique_ptr<dbus::Response> DisplayPinCode(dbus::MethodCall* call);
  std::unique_ptr<dbus::Response> RequestPasskey(dbus::MethodCall* call);
  std::unique_ptr<dbus::Response> DisplayPasskey(dbus::MethodCall* call);
  std::unique_ptr<dbus::Response> RequestConfirmation(dbus::MethodCall* call);
  std::unique_ptr<dbus::Response> RequestAuthorization(dbus::MethodCall* call);
  std::unique_ptr<dbus::Response> AuthorizeService(dbus::MethodCall* call);
  std::unique_ptr<dbus::Response> Cancel(dbus::MethodCall* call);

 private:
  // Pointer to a member function for handling a DBus method call.
  typedef std::unique_ptr<dbus::Response> (
      AgentDBusAdaptor::*SyncDBusMethodCallMemberFunction)(dbus::MethodCall*);

  void ExportSyncDBusMethod(dbus::ExportedObject* object,
                            const std::string& method_name,
                            SyncDBusMethodCallMemberFunction member);

  AgentInterface* const impl_;  // Not owned.

  DISALLOW_COPY_AND_ASSIGN(AgentDBusAdaptor);
};

}  // namespace btserial

#endif  // BTSERIAL_AGENT_DBUS_ADAPTOR_H_
