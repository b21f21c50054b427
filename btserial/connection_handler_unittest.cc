// Copyright 2018 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "btserial/connection_handler.h"

#include <fcntl.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <time.h>

#include <string>
#include <utility>
#include <vector>

#include <base/bind.h>
#include <base/files/scoped_file.h>
#include <base/location.h>
#include <base/logging.h>
#include <base/posix/eintr_wrapper.h>
#include <base/threading/thread.h>
#include <base/time/time.h>
#include <gtest/gtest.h>

namespace btserial {

namespace {

constexpr char kDevicePath[] = "/org/bluez/hci0/dev_00_11_22_33_44_55";

// Returned by ReadReply() once the handler has closed its end.
constexpr char kEndOfStream[] = "<eof>";

CommandReply FailingCommand(const std::string& data) {
  CommandReply reply;
  reply.status = CommandStatus::kFailed;
  reply.payload = "device busy";
  return reply;
}

CommandReply UpperCommand(const std::string& data) {
  CommandReply reply;
  if (data.empty()) {
    reply.status = CommandStatus::kInvalidData;
    return reply;
  }
  reply.payload = "SUCCESS UPPER " + data;
  return reply;
}

// Sends |request| from the peer side, then closes it for writing.
void SendAndShutdown(int fd, const std::string& request) {
  EXPECT_EQ(static_cast<ssize_t>(request.size()),
            HANDLE_EINTR(send(fd, request.data(), request.size(),
                              MSG_NOSIGNAL)));
  EXPECT_EQ(0, shutdown(fd, SHUT_WR));
}

std::vector<std::string>* g_log_messages = nullptr;

bool CaptureLogMessage(int severity,
                       const char* file,
                       int line,
                       size_t message_start,
                       const std::string& str) {
  if (g_log_messages)
    g_log_messages->push_back(str.substr(message_start));
  return true;
}

bool HasLogMessage(const std::vector<std::string>& messages,
                   const std::string& text) {
  for (const auto& message : messages) {
    if (message.find(text) != std::string::npos)
      return true;
  }
  return false;
}

bool CreateSocketPair(base::ScopedFD* local, base::ScopedFD* remote) {
  int fds[2];
  if (socketpair(AF_UNIX, SOCK_SEQPACKET, 0, fds) != 0)
    return false;
  local->reset(fds[0]);
  remote->reset(fds[1]);
  return true;
}

}  // namespace

class ConnectionHandlerTest : public ::testing::Test {
 public:
  ConnectionHandlerTest() : device_(kDevicePath) {}

  void SetUp() override {
    ASSERT_TRUE(CreateSocketPair(&local_fd_, &remote_fd_));
  }

 protected:
  void SendRequest(const std::string& request) {
    ASSERT_EQ(static_cast<ssize_t>(request.size()),
              HANDLE_EINTR(send(remote_fd_.get(), request.data(),
                                request.size(), MSG_NOSIGNAL)));
  }

  // Queues |requests|, closes the sending side and serves the session to
  // completion.
  void RunSession(const std::vector<std::string>& requests) {
    for (const auto& request : requests)
      SendRequest(request);
    ASSERT_EQ(0, shutdown(remote_fd_.get(), SHUT_WR));
    ASSERT_TRUE(handler_.NewConnection(device_, std::move(local_fd_)));
  }

  std::string ReadReply() {
    char buffer[kReadChunkSize];
    ssize_t bytes = HANDLE_EINTR(
        recv(remote_fd_.get(), buffer, sizeof(buffer), MSG_DONTWAIT));
    if (bytes <= 0)
      return kEndOfStream;
    return std::string(buffer, bytes);
  }

  dbus::ObjectPath device_;
  base::ScopedFD local_fd_;
  base::ScopedFD remote_fd_;
  ConnectionHandler handler_;
};

TEST_F(ConnectionHandlerTest, GreetsAndAnswersPing) {
  RunSession({"PING"});

  EXPECT_EQ("WAITING", ReadReply());
  EXPECT_EQ("SUCCESS PING", ReadReply());
  EXPECT_EQ(kEndOfStream, ReadReply());
  EXPECT_FALSE(handler_.has_descriptor());
  EXPECT_EQ(ConnectionState::kClosed, handler_.state());
}

TEST_F(ConnectionHandlerTest, TrimsSurroundingWhitespace) {
  RunSession({"  PING \r\n"});

  EXPECT_EQ("WAITING", ReadReply());
  EXPECT_EQ("SUCCESS PING", ReadReply());
}

TEST_F(ConnectionHandlerTest, EmptyRequestKeepsSessionActive) {
  RunSession({"\n", " \t ", "PING"});

  EXPECT_EQ("WAITING", ReadReply());
  EXPECT_EQ(kInvalidRequestReply, ReadReply());
  EXPECT_EQ(kInvalidRequestReply, ReadReply());
  EXPECT_EQ("SUCCESS PING", ReadReply());
}

TEST_F(ConnectionHandlerTest, UnknownCommand) {
  RunSession({"FROB now", "ping"});

  EXPECT_EQ("WAITING", ReadReply());
  EXPECT_EQ("ERROR invalid command FROB", ReadReply());
  EXPECT_EQ("ERROR invalid command ping", ReadReply());
}

TEST_F(ConnectionHandlerTest, Echo) {
  RunSession({"ECHO hello  world\n", "ECHO", "ECHO   "});

  EXPECT_EQ("WAITING", ReadReply());
  EXPECT_EQ("hello  world", ReadReply());
  EXPECT_EQ("ERROR invalid data for ECHO", ReadReply());
  EXPECT_EQ("ERROR invalid data for ECHO", ReadReply());
}

TEST_F(ConnectionHandlerTest, VersionAndHelp) {
  RunSession({"VERSION", "HELP"});

  EXPECT_EQ("WAITING", ReadReply());
  EXPECT_EQ(std::string("SUCCESS VERSION ") + kProtocolVersion, ReadReply());
  EXPECT_EQ("SUCCESS HELP ECHO HELP PING QUIT VERSION", ReadReply());
}

TEST_F(ConnectionHandlerTest, QuitEndsSession) {
  RunSession({"QUIT", "PING"});

  EXPECT_EQ("WAITING", ReadReply());
  EXPECT_EQ("SUCCESS QUIT", ReadReply());
  EXPECT_EQ(kEndOfStream, ReadReply());
  EXPECT_FALSE(handler_.has_descriptor());
}

TEST_F(ConnectionHandlerTest, FailingCommandDoesNotEndSession) {
  handler_.AddCommand("RESET", base::Bind(&FailingCommand));
  RunSession({"RESET", "PING"});

  EXPECT_EQ("WAITING", ReadReply());
  EXPECT_EQ("ERROR exception processing RESET: device busy", ReadReply());
  EXPECT_EQ("SUCCESS PING", ReadReply());
}

TEST_F(ConnectionHandlerTest, CustomCommand) {
  handler_.AddCommand("UPPER", base::Bind(&UpperCommand));
  RunSession({"UPPER abc", "UPPER", "HELP"});

  EXPECT_EQ("WAITING", ReadReply());
  EXPECT_EQ("SUCCESS UPPER abc", ReadReply());
  EXPECT_EQ("ERROR invalid data for UPPER", ReadReply());
  EXPECT_EQ("SUCCESS HELP ECHO HELP PING QUIT UPPER VERSION", ReadReply());
}

TEST_F(ConnectionHandlerTest, HandleRequestReportsEndOfSession) {
  bool end_session = true;
  EXPECT_EQ(kInvalidRequestReply, handler_.HandleRequest("", &end_session));
  EXPECT_FALSE(end_session);

  EXPECT_EQ("SUCCESS PING", handler_.HandleRequest("PING", &end_session));
  EXPECT_FALSE(end_session);

  EXPECT_EQ("SUCCESS QUIT", handler_.HandleRequest("QUIT\n", &end_session));
  EXPECT_TRUE(end_session);
}

TEST_F(ConnectionHandlerTest, RequestDisconnectionTwice) {
  ASSERT_TRUE(handler_.Accept(device_, std::move(local_fd_)));
  EXPECT_TRUE(handler_.has_descriptor());
  EXPECT_EQ(ConnectionState::kWaiting, handler_.state());

  handler_.RequestDisconnection(device_);
  EXPECT_FALSE(handler_.has_descriptor());
  EXPECT_EQ(ConnectionState::kClosed, handler_.state());

  handler_.RequestDisconnection(device_);
  EXPECT_FALSE(handler_.has_descriptor());
  EXPECT_EQ(ConnectionState::kClosed, handler_.state());

  // The peer sees the close.
  EXPECT_EQ(kEndOfStream, ReadReply());
}

TEST_F(ConnectionHandlerTest, RefusesSecondConnection) {
  base::ScopedFD second_local;
  base::ScopedFD second_remote;
  ASSERT_TRUE(CreateSocketPair(&second_local, &second_remote));

  ASSERT_TRUE(handler_.Accept(device_, std::move(local_fd_)));
  EXPECT_FALSE(handler_.Accept(dbus::ObjectPath("/org/bluez/hci0/dev_other"),
                               std::move(second_local)));

  // The refused descriptor is closed, the first one is kept.
  char byte;
  EXPECT_EQ(0, HANDLE_EINTR(recv(second_remote.get(), &byte, 1, 0)));
  EXPECT_TRUE(handler_.has_descriptor());
}

TEST_F(ConnectionHandlerTest, AcceptClearsNonBlockingMode) {
  const int fd = local_fd_.get();
  int flags = fcntl(fd, F_GETFL);
  ASSERT_LE(0, flags);
  ASSERT_EQ(0, fcntl(fd, F_SETFL, flags | O_NONBLOCK));

  ASSERT_TRUE(handler_.Accept(device_, std::move(local_fd_)));
  EXPECT_EQ(0, fcntl(fd, F_GETFL) & O_NONBLOCK);
}

TEST_F(ConnectionHandlerTest, WaitsForLateRequestOnNonBlockingDescriptor) {
  int flags = fcntl(local_fd_.get(), F_GETFL);
  ASSERT_LE(0, flags);
  ASSERT_EQ(0, fcntl(local_fd_.get(), F_SETFL, flags | O_NONBLOCK));
  ASSERT_TRUE(handler_.Accept(device_, std::move(local_fd_)));

  // The request only arrives once the loop is already waiting.
  base::Thread peer("peer");
  ASSERT_TRUE(peer.Start());
  ASSERT_TRUE(peer.task_runner()->PostDelayedTask(
      FROM_HERE,
      base::Bind(&SendAndShutdown, remote_fd_.get(), std::string("PING")),
      base::TimeDelta::FromMilliseconds(100)));
  handler_.Run();
  peer.Stop();

  EXPECT_EQ("WAITING", ReadReply());
  EXPECT_EQ("SUCCESS PING", ReadReply());
  EXPECT_EQ(kEndOfStream, ReadReply());
  EXPECT_FALSE(handler_.has_descriptor());
}

TEST_F(ConnectionHandlerTest, PendingTerminationSignalEndsSession) {
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGUSR1);
  sigset_t old_mask;
  ASSERT_EQ(0, pthread_sigmask(SIG_BLOCK, &signals, &old_mask));
  handler_.set_termination_signals(signals);

  SendRequest("PING");
  ASSERT_EQ(0, raise(SIGUSR1));
  ASSERT_TRUE(handler_.NewConnection(device_, std::move(local_fd_)));

  EXPECT_EQ("WAITING", ReadReply());
  EXPECT_EQ(kEndOfStream, ReadReply());
  EXPECT_FALSE(handler_.has_descriptor());
  EXPECT_EQ(ConnectionState::kClosed, handler_.state());

  // The signal is left for the daemon's own handler.
  sigset_t pending;
  ASSERT_EQ(0, sigpending(&pending));
  EXPECT_EQ(1, sigismember(&pending, SIGUSR1));

  const struct timespec no_wait = {0, 0};
  EXPECT_EQ(SIGUSR1, sigtimedwait(&signals, nullptr, &no_wait));
  ASSERT_EQ(0, pthread_sigmask(SIG_SETMASK, &old_mask, nullptr));
}

TEST_F(ConnectionHandlerTest, LogsEveryReply) {
  std::vector<std::string> messages;
  g_log_messages = &messages;
  const int min_log_level = logging::GetMinLogLevel();
  logging::SetMinLogLevel(-1);
  logging::SetLogMessageHandler(&CaptureLogMessage);

  bool end_session = false;
  handler_.HandleRequest("  ", &end_session);
  handler_.HandleRequest("FROB", &end_session);
  handler_.HandleRequest("PING", &end_session);

  logging::SetLogMessageHandler(nullptr);
  logging::SetMinLogLevel(min_log_level);
  g_log_messages = nullptr;

  EXPECT_TRUE(HasLogMessage(messages, "Reply: 'ERROR invalid request'"));
  EXPECT_TRUE(HasLogMessage(messages, "Reply: 'ERROR invalid command FROB'"));
  EXPECT_TRUE(HasLogMessage(messages, "Reply: 'SUCCESS PING'"));
}

TEST_F(ConnectionHandlerTest, RunWithoutConnection) {
  handler_.Run();
  EXPECT_EQ(ConnectionState::kClosed, handler_.state());
}

}  // namespace btserial
