// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BTSERIAL_DBUS_UTILS_H_
#define BTSERIAL_DBUS_UTILS_H_

#include <memory>

#include <base/callback.h>
#include <dbus/exported_object.h>
#include <dbus/message.h>

namespace btserial {

using SyncDBusMethodCallback =
    base::Callback<std::unique_ptr<dbus::Response>(dbus::MethodCall*)>;

// Passes |method_call| to |handler| and passes the response to
// |response_sender|. If |handler| returns null, an empty response is created
// and sent.
void HandleSynchronousDBusMethodCall(
    const SyncDBusMethodCallback& handler,
    dbus::MethodCall* method_call,
    dbus::ExportedObject::ResponseSender response_sender);

// Creates a new "invalid args" reply to |call|.
std::unique_ptr<dbus::Response> CreateInvalidArgsError(dbus::MethodCall* call);

}  // namespace btserial

#endif  // BTSERIAL_DBUS_UTILS_H_
