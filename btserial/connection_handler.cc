// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "btserial/connection_handler.h"

#include <fcntl.h>
#include <poll.h>
#include <sys/signalfd.h>
#include <unistd.h>

#include <utility>
#include <vector>

#include <base/bind.h>
#include <base/files/file_util.h>
#include <base/logging.h>
#include <base/posix/eintr_wrapper.h>
#include <base/strings/string_util.h>

namespace btserial {

const char kProtocolVersion[] = "1.0";
const char kGreetingReply[] = "WAITING";
const char kInvalidRequestReply[] = "ERROR invalid request";

namespace {

constexpr char kPingCommand[] = "PING";
constexpr char kEchoCommand[] = "ECHO";
constexpr char kVersionCommand[] = "VERSION";
constexpr char kHelpCommand[] = "HELP";
constexpr char kQuitCommand[] = "QUIT";

CommandReply MakeReply(CommandStatus status, const std::string& payload) {
  CommandReply reply;
  reply.status = status;
  reply.payload = payload;
  return reply;
}

CommandReply HandlePing(const std::string& data) {
  return CommandReply();
}

CommandReply HandleEcho(const std::string& data) {
  if (data.empty())
    return MakeReply(CommandStatus::kInvalidData, std::string());
  return MakeReply(CommandStatus::kSuccess, data);
}

CommandReply HandleVersion(const std::string& data) {
  return MakeReply(CommandStatus::kSuccess,
                   std::string("SUCCESS ") + kVersionCommand + " " +
                       kProtocolVersion);
}

CommandReply HandleQuit(const std::string& data) {
  return MakeReply(CommandStatus::kEndSession, std::string());
}

}  // namespace

ConnectionHandler::ConnectionHandler() {
  sigemptyset(&termination_signals_);
  sigaddset(&termination_signals_, SIGTERM);
  sigaddset(&termination_signals_, SIGINT);

  AddCommand(kPingCommand, base::Bind(&HandlePing));
  AddCommand(kEchoCommand, base::Bind(&HandleEcho));
  AddCommand(kVersionCommand, base::Bind(&HandleVersion));
  AddCommand(kHelpCommand, base::Bind(&ConnectionHandler::HandleHelp,
                                      base::Unretained(this)));
  AddCommand(kQuitCommand, base::Bind(&HandleQuit));
}

ConnectionHandler::~ConnectionHandler() {
  ReleaseDescriptor();
}

void ConnectionHandler::AddCommand(const std::string& word,
                                   const CommandHandler& handler) {
  DCHECK(!word.empty());
  commands_[word] = handler;
}

bool ConnectionHandler::Accept(const dbus::ObjectPath& device,
                               base::ScopedFD fd) {
  if (fd_.is_valid()) {
    LOG(WARNING) << "Refusing connection from " << device.value()
                 << " while serving " << device_.value();
    return false;
  }
  if (!fd.is_valid()) {
    LOG(ERROR) << "Invalid descriptor for " << device.value();
    return false;
  }
  // BlueZ hands over its accepted RFCOMM socket in non-blocking mode.
  int flags = HANDLE_EINTR(fcntl(fd.get(), F_GETFL));
  if (flags < 0 ||
      HANDLE_EINTR(fcntl(fd.get(), F_SETFL, flags & ~O_NONBLOCK)) < 0) {
    PLOG(ERROR) << "Failed to make the descriptor of " << device.value()
                << " blocking";
    return false;
  }

  LOG(INFO) << "New connection from " << device.value() << " on fd "
            << fd.get();
  fd_ = std::move(fd);
  device_ = device;
  state_ = ConnectionState::kWaiting;
  return true;
}

void ConnectionHandler::Run() {
  if (!fd_.is_valid()) {
    LOG(WARNING) << "No connection to serve";
    return;
  }

  state_ = ConnectionState::kActive;
  if (!SendReply(kGreetingReply)) {
    ReleaseDescriptor();
    return;
  }

  base::ScopedFD signal_fd(
      signalfd(-1, &termination_signals_, SFD_NONBLOCK | SFD_CLOEXEC));
  if (!signal_fd.is_valid())
    PLOG(WARNING) << "Cannot watch termination signals during the session";

  char buffer[kReadChunkSize];
  while (state_ == ConnectionState::kActive) {
    WaitResult wait_result = WaitForRequest(signal_fd.get());
    if (wait_result == WaitResult::kFailed)
      break;
    if (wait_result == WaitResult::kTerminated) {
      LOG(INFO) << "Termination requested, ending session with "
                << device_.value();
      break;
    }

    ssize_t bytes_read = HANDLE_EINTR(read(fd_.get(), buffer, sizeof(buffer)));
    if (bytes_read < 0) {
      PLOG(ERROR) << "Failed to read from " << device_.value();
      break;
    }
    if (bytes_read == 0) {
      LOG(INFO) << device_.value() << " closed the connection";
      break;
    }

    bool end_session = false;
    std::string reply =
        HandleRequest(std::string(buffer, bytes_read), &end_session);
    if (!SendReply(reply))
      break;
    if (end_session) {
      LOG(INFO) << device_.value() << " ended the session";
      break;
    }
  }
  ReleaseDescriptor();
}

bool ConnectionHandler::NewConnection(const dbus::ObjectPath& device,
                                      base::ScopedFD fd) {
  if (!Accept(device, std::move(fd)))
    return false;
  Run();
  return true;
}

void ConnectionHandler::RequestDisconnection(const dbus::ObjectPath& device) {
  LOG(INFO) << "Disconnection requested for " << device.value();
  ReleaseDescriptor();
}

void ConnectionHandler::Release() {
  LOG(INFO) << "Profile released by BlueZ";
  ReleaseDescriptor();
}

std::string ConnectionHandler::HandleRequest(const std::string& request,
                                             bool* end_session) {
  *end_session = false;
  std::string line;
  base::TrimWhitespaceASCII(request, base::TRIM_ALL, &line);
  VLOG(1) << "Request: '" << line << "'";

  std::string reply =
      line.empty() ? std::string(kInvalidRequestReply)
                   : DispatchRequest(line, end_session);
  VLOG(1) << "Reply: '" << reply << "'";
  return reply;
}

std::string ConnectionHandler::DispatchRequest(const std::string& line,
                                               bool* end_session) {
  std::string word = line;
  std::string data;
  size_t separator = line.find_first_of(base::kWhitespaceASCII);
  if (separator != std::string::npos) {
    word = line.substr(0, separator);
    base::TrimWhitespaceASCII(line.substr(separator), base::TRIM_LEADING,
                              &data);
  }

  auto it = commands_.find(word);
  if (it == commands_.end()) {
    LOG(WARNING) << "Unknown command " << word;
    return "ERROR invalid command " + word;
  }

  CommandReply result = it->second.Run(data);
  std::string reply;
  switch (result.status) {
    case CommandStatus::kSuccess:
    case CommandStatus::kEndSession:
      *end_session = result.status == CommandStatus::kEndSession;
      reply = result.payload.empty() ? "SUCCESS " + word : result.payload;
      break;
    case CommandStatus::kInvalidData:
      LOG(WARNING) << "Invalid data for " << word << ": '" << data << "'";
      reply = "ERROR invalid data for " + word;
      break;
    case CommandStatus::kFailed:
      LOG(ERROR) << "Command " << word << " failed: " << result.payload;
      reply = "ERROR exception processing " + word + ": " + result.payload;
      break;
  }
  return reply;
}

CommandReply ConnectionHandler::HandleHelp(const std::string& data) {
  std::vector<std::string> words;
  for (const auto& command : commands_)
    words.push_back(command.first);
  return MakeReply(CommandStatus::kSuccess,
                   std::string("SUCCESS ") + kHelpCommand + " " +
                       base::JoinString(words, " "));
}

ConnectionHandler::WaitResult ConnectionHandler::WaitForRequest(
    int signal_fd) {
  // poll() skips negative descriptors.
  struct pollfd fds[] = {
      {fd_.get(), POLLIN, 0},
      {signal_fd, POLLIN, 0},
  };
  if (HANDLE_EINTR(poll(fds, arraysize(fds), -1)) < 0) {
    PLOG(ERROR) << "Failed to wait for " << device_.value();
    return WaitResult::kFailed;
  }
  // The signal stays pending, signalfd is only polled and never read.
  if (fds[1].revents & POLLIN)
    return WaitResult::kTerminated;
  // Hang-ups and errors are reported by the following read().
  return WaitResult::kReadable;
}

bool ConnectionHandler::SendReply(const std::string& reply) {
  if (!base::WriteFileDescriptor(fd_.get(), reply.data(), reply.size())) {
    PLOG(ERROR) << "Failed to write to " << device_.value();
    return false;
  }
  return true;
}

void ConnectionHandler::ReleaseDescriptor() {
  if (fd_.is_valid()) {
    LOG(INFO) << "Closing connection to " << device_.value();
    fd_.reset();
  }
  state_ = ConnectionState::kClosed;
}

}  // namespace btserial
