// runc-sandboxer - Namespace bootstrap for runc sandboxes
// Copyright (c) 2024 runc-sandboxer contributors
// All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "sandbox-parent.h"
#include "reap.h"
#include <kj/debug.h>
#include <sys/prctl.h>
#include <signal.h>
#include <errno.h>
#include <string.h>

namespace sandboxer {

SandboxParent::SandboxParent(
    pid_t pid, kj::AutoCloseFd requestWrite, kj::AutoCloseFd responseRead)
    : pid(pid), channel(Channel { kj::mv(requestWrite), kj::mv(responseRead) }) {}

pid_t SandboxParent::forkSandbox(kj::StringPtr sandboxId, kj::StringPtr netnsPath) const {
  auto request = encodeForkRequest(sandboxId, netnsPath);
  kj::FixedArray<byte, RESPONSE_FRAME_SIZE> response;

  {
    auto lock = channel.lockExclusive();
    writeExact(lock->requestWrite, request.asPtr());
    readExact(lock->responseRead, response.asPtr());
  }

  int32_t result = decodePid(response.asPtr());
  if (result < 0) {
    KJ_FAIL_SYSCALL("forkSandbox()", -result, sandboxId, netnsPath);
  }
  KJ_ASSERT(result > 0, "sandbox parent answered with pid 0", sandboxId);
  return result;
}

// =======================================================================================

static kj::Array<int> channelFds(int requestRead, int responseWrite) {
  auto fds = kj::heapArray<int>(2);
  fds[0] = requestRead;
  fds[1] = responseWrite;
  return fds;
}

SandboxParentServer::SandboxParentServer(
    kj::AutoCloseFd requestReadParam, kj::AutoCloseFd responseWriteParam)
    : requestRead(kj::mv(requestReadParam)), responseWrite(kj::mv(responseWriteParam)),
      factory(channelFds(requestRead, responseWrite)) {}

ForkRequest SandboxParentServer::receiveRequest() {
  kj::FixedArray<byte, REQUEST_FRAME_SIZE> frame;
  readExact(requestRead, frame.asPtr());
  return decodeForkRequest(frame.asPtr());
}

void SandboxParentServer::sendResponse(int32_t pid) {
  auto frame = encodePid(pid);
  writeExact(responseWrite, frame.asPtr());
}

void SandboxParentServer::serveOne() {
  auto request = receiveRequest();

  int32_t result = 0;
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    result = factory.create(request.sandboxId, request.netnsPath);
  })) {
    KJ_LOG(ERROR, "sandbox creation failed", request.sandboxId, *exception);
    result = errnoForException(*exception);
  }

  sendResponse(result);
}

void SandboxParentServer::run() {
  for (;;) {
    serveOne();
  }
}

int32_t errnoForException(const kj::Exception& exception) {
  switch (exception.getType()) {
    case kj::Exception::Type::OVERLOADED:
      return -EAGAIN;
    case kj::Exception::Type::DISCONNECTED:
      return -EPIPE;
    case kj::Exception::Type::UNIMPLEMENTED:
      return -ENOSYS;
    default:
      return -EIO;
  }
}

// =======================================================================================

namespace {

void reapHandler(int) {
  int savedErrno = errno;
  int error = reapAll([](pid_t pid, int exitCode) {
    if (kj::_::Debug::shouldLog(kj::LogSeverity::INFO)) {
      logChildSafely("exited", pid, exitCode);
    }
  });
  if (error != 0) {
    logErrorSafely("waitpid() in SIGCHLD handler", error);
  }
  errno = savedErrno;
}

void runSandboxParent(kj::AutoCloseFd requestRead, kj::AutoCloseFd responseWrite) KJ_NORETURN;
void runSandboxParent(kj::AutoCloseFd requestRead, kj::AutoCloseFd responseWrite) {
  // The signal mask survives fork(); make sure our SIGCHLD handler can run.
  sigset_t sigmask;
  KJ_SYSCALL(sigemptyset(&sigmask));
  KJ_SYSCALL(sigaddset(&sigmask, SIGCHLD));
  KJ_SYSCALL(sigprocmask(SIG_UNBLOCK, &sigmask, nullptr));

  // A main program that went away shows up as EPIPE on the response pipe.
  struct sigaction ignore;
  memset(&ignore, 0, sizeof(ignore));
  ignore.sa_handler = SIG_IGN;
  KJ_SYSCALL(sigaction(SIGPIPE, &ignore, nullptr));

  // Orphaned descendants, in particular every sandbox leader once its launcher exits, are
  // reparented to us rather than to init.
  KJ_SYSCALL(prctl(PR_SET_CHILD_SUBREAPER, 1, 0, 0, 0));

  setProcessName("[sandbox-parent]");
  installReapHandler();

  SandboxParentServer server(kj::mv(requestRead), kj::mv(responseWrite));
  server.run();
}

}  // namespace

void installReapHandler() {
  struct sigaction action;
  memset(&action, 0, sizeof(action));
  action.sa_handler = &reapHandler;
  // No SA_RESTART: blocking pipe reads see EINTR and readExact() retries them.
  action.sa_flags = SA_NOCLDSTOP;
  KJ_SYSCALL(sigemptyset(&action.sa_mask));
  KJ_SYSCALL(sigaction(SIGCHLD, &action, nullptr));
}

int serveSandboxParent(kj::AutoCloseFd requestRead, kj::AutoCloseFd responseWrite) {
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    runSandboxParent(kj::mv(requestRead), kj::mv(responseWrite));
  })) {
    if (isClosedChannel(*exception)) {
      KJ_LOG(INFO, "main program closed the channel; sandbox parent exiting");
      return 0;
    }
    KJ_LOG(FATAL, "sandbox parent failed", *exception);
  }
  return 1;
}

kj::Own<SandboxParent> forkSandboxParent() {
  auto requests = Pipe::make();
  auto responses = Pipe::make();

  pid_t child;
  KJ_SYSCALL(child = fork(), "couldn't fork sandbox parent");
  if (child == 0) {
    KJ_DEFER(_exit(1));  // Do not under any circumstances return from this stack frame!
    requests.writeEnd = nullptr;
    responses.readEnd = nullptr;
    _exit(serveSandboxParent(kj::mv(requests.readEnd), kj::mv(responses.writeEnd)));
  }

  KJ_LOG(INFO, "forked sandbox parent", child);
  requests.readEnd = nullptr;
  responses.writeEnd = nullptr;
  return kj::heap<SandboxParent>(child, kj::mv(requests.writeEnd), kj::mv(responses.readEnd));
}

}  // namespace sandboxer
