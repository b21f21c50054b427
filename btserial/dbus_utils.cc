// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "btserial/dbus_utils.h"

#include <utility>

#include <dbus/dbus-protocol.h>

namespace btserial {

void HandleSynchronousDBusMethodCall(
    const SyncDBusMethodCallback& handler,
    dbus::MethodCall* method_call,
    dbus::ExportedObject::ResponseSender response_sender) {
  std::unique_ptr<dbus::Response> response = handler.Run(method_call);
  if (!response)
    response = dbus::Response::FromMethodCall(method_call);
  response_sender.Run(std::move(response));
}

std::unique_ptr<dbus::Response> CreateInvalidArgsError(dbus::MethodCall* call) {
  return dbus::ErrorResponse::FromMethodCall(
      call, DBUS_ERROR_INVALID_ARGS, "Signature is: " + call->GetSignature());
}

}  // namespace btserial
