// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef BTSERIAL_CONNECTION_HANDLER_H_
#define BTSERIAL_CONNECTION_HANDLER_H_

#include <signal.h>

#include <map>
#include <string>

#include <base/callback.h>
#include <base/files/scoped_file.h>
#include <base/macros.h>
#include <dbus/object_path.h>

namespace btserial {

// Largest request read from the socket at once.
constexpr size_t kReadChunkSize = 4096;

// Version reported by the VERSION command.
extern const char kProtocolVersion[];

// Replies with fixed content.
extern const char kGreetingReply[];
extern const char kInvalidRequestReply[];

enum class ConnectionState {
  kWaiting,  // Descriptor received, nothing exchanged yet.
  kActive,   // Request/reply loop running.
  kClosed,   // No descriptor owned.
};

enum class CommandStatus {
  kSuccess,
  kInvalidData,
  kFailed,
  // Success that also ends the session once the reply has been sent.
  kEndSession,
};

// What a command handler produced. For kSuccess and kEndSession an empty
// |payload| means the default "SUCCESS <WORD>" reply, otherwise |payload| is
// sent as is. For kFailed |payload| is the failure message.
struct CommandReply {
  CommandStatus status = CommandStatus::kSuccess;
  std::string payload;
};

// Receives the data following the command word, possibly empty.
using CommandHandler = base::Callback<CommandReply(const std::string& data)>;

// Owns the RFCOMM socket of one connection at a time and runs the text
// request/reply protocol on it. Requests are read in chunks of at most
// kReadChunkSize bytes, one request per read, and every request is answered
// before the next one is read.
class ConnectionHandler {
 public:
  ConnectionHandler();
  ~ConnectionHandler();

  // Registers |handler| for |word|, replacing any previous handler.
  void AddCommand(const std::string& word, const CommandHandler& handler);

  // Takes ownership of |fd| for |device| and puts it in blocking mode. Fails
  // when a connection is already owned or the mode cannot be changed; |fd| is
  // closed in that case.
  bool Accept(const dbus::ObjectPath& device, base::ScopedFD fd);

  // Sends the greeting and serves requests until the peer disconnects, the
  // socket fails, a command ends the session or one of the termination
  // signals is pending. Releases the descriptor before returning.
  void Run();

  // Replaces the signals that end a running session, SIGTERM and SIGINT by
  // default. They must be blocked by the caller, as brillo::Daemon does, and
  // are left pending for the caller's own handler.
  void set_termination_signals(const sigset_t& signals) {
    termination_signals_ = signals;
  }

  // Convenience for Accept() followed by Run().
  bool NewConnection(const dbus::ObjectPath& device, base::ScopedFD fd);

  // Closes the owned descriptor, if any. Safe to call repeatedly.
  void RequestDisconnection(const dbus::ObjectPath& device);

  // Called when BlueZ drops the profile.
  void Release();

  // Builds the reply for a single raw request. Sets |end_session| when the
  // loop has to stop after sending the reply.
  std::string HandleRequest(const std::string& request, bool* end_session);

  ConnectionState state() const { return state_; }
  bool has_descriptor() const { return fd_.is_valid(); }

 private:
  enum class WaitResult {
    kReadable,
    kTerminated,
    kFailed,
  };

  // Blocks until |fd_| has something to read or |signal_fd| reports a
  // pending termination signal. |signal_fd| may be -1.
  WaitResult WaitForRequest(int signal_fd);

  // Builds the reply for a trimmed, non-empty request.
  std::string DispatchRequest(const std::string& line, bool* end_session);

  CommandReply HandleHelp(const std::string& data);

  bool SendReply(const std::string& reply);
  void ReleaseDescriptor();

  base::ScopedFD fd_;
  dbus::ObjectPath device_;
  ConnectionState state_ = ConnectionState::kClosed;
  std::map<std::string, CommandHandler> commands_;
  sigset_t termination_signals_;

  DISALLOW_COPY_AND_ASSIGN(ConnectionHandler);
};

}  // namespace btserial

#endif  // BTSERIAL_CONNECTION_HANDLER_H_
