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

#include "sandbox-factory.h"
#include "channel.h"
#include <kj/debug.h>
#include <sched.h>
#include <signal.h>
#include <errno.h>
#include <string.h>

namespace sandboxer {

PidHandoff PidHandoff::make() {
  return PidHandoff(Pipe::make());
}

void PidHandoff::send(int32_t value) {
  auto frame = encodePid(value);
  writeExact(pipe.writeEnd, frame.asPtr());
  pipe.writeEnd = nullptr;
}

int32_t PidHandoff::receive() {
  kj::FixedArray<byte, RESPONSE_FRAME_SIZE> frame;
  readExact(pipe.readEnd, frame.asPtr());
  return decodePid(frame.asPtr());
}

// =======================================================================================

namespace {

void runLeader(PidHandoff& ready, kj::StringPtr sandboxId, kj::StringPtr netnsPath)
    KJ_NORETURN;
void runLeader(PidHandoff& ready, kj::StringPtr sandboxId, kj::StringPtr netnsPath) {
  // We are the sandbox leader: pid 1 of the new PID namespace. We keep the SIGCHLD handler
  // inherited from the sandbox parent, since orphans inside our PID namespace are reparented
  // to us.

  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    setProcessName(kj::str("[sandbox-", sandboxId, "]"));
  })) {
    KJ_LOG(WARNING, "couldn't set sandbox process name", sandboxId, *exception);
  }

  int error = 0;
  if (netnsPath.size() > 0) {
    int netns = open(netnsPath.cStr(), O_RDONLY | O_CLOEXEC);
    if (netns < 0) {
      error = errno;
      KJ_LOG(ERROR, "couldn't open network namespace", netnsPath, strerror(error));
    } else {
      if (setns(netns, CLONE_NEWNET) < 0) {
        error = errno;
        KJ_LOG(ERROR, "couldn't join network namespace", netnsPath, strerror(error));
      }
      close(netns);
    }
  }

  ready.send(error);
  if (error != 0) {
    _exit(1);
  }

  for (;;) {
    pause();
  }
}

int32_t forkLeader(PidHandoff& handoff, kj::StringPtr sandboxId, kj::StringPtr netnsPath) {
  // Runs in the launcher, after unshare(). The leader reports 0 on `ready` once it has joined
  // its network namespace, or the errno that stopped it.

  auto ready = PidHandoff::make();

  pid_t leader = fork();
  if (leader < 0) {
    int error = errno;
    KJ_LOG(ERROR, "couldn't fork sandbox leader", sandboxId, strerror(error));
    return -error;
  }

  if (leader == 0) {
    KJ_DEFER(_exit(1));  // Do not under any circumstances return from this stack frame!
    KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
      // The launcher's handoff must close when the launcher exits, even if the leader lives on.
      handoff.closeWriteEnd();
      ready.closeReadEnd();
      runLeader(ready, sandboxId, netnsPath);
    })) {
      KJ_LOG(ERROR, "sandbox leader failed", sandboxId, *exception);
    }
  }

  ready.closeWriteEnd();
  KJ_LOG(INFO, "forked sandbox leader", leader, sandboxId);

  int32_t error = 0;
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    error = ready.receive();
  })) {
    if (!isClosedChannel(*exception)) {
      kj::throwFatalException(kj::mv(*exception));
    }
    KJ_LOG(ERROR, "sandbox leader exited before it was ready", leader, sandboxId);
    return -ECHILD;
  }

  return error == 0 ? leader : -error;
}

}  // namespace

SandboxFactory::SandboxFactory(kj::Array<int> inheritedFds)
    : inheritedFds(kj::mv(inheritedFds)) {}

int32_t SandboxFactory::create(kj::StringPtr sandboxId, kj::StringPtr netnsPath) {
  auto handoff = PidHandoff::make();

  pid_t launcher = fork();
  if (launcher < 0) {
    int error = errno;
    KJ_LOG(ERROR, "couldn't fork sandbox launcher", sandboxId, strerror(error));
    return -error;
  }

  if (launcher == 0) {
    KJ_DEFER(_exit(1));  // Do not under any circumstances return from this stack frame!
    KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
      handoff.closeReadEnd();
      for (int fd: inheritedFds) {
        close(fd);
      }
      runLauncher(handoff, sandboxId, netnsPath);
    })) {
      KJ_LOG(ERROR, "sandbox launcher failed", sandboxId, *exception);
    }
  }

  // The launcher exits on its own; whoever handles our SIGCHLD reaps it.
  handoff.closeWriteEnd();
  KJ_LOG(INFO, "forked sandbox launcher", launcher, sandboxId);

  int32_t result = 0;
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    result = handoff.receive();
  })) {
    if (!isClosedChannel(*exception)) {
      kj::throwFatalException(kj::mv(*exception));
    }
    KJ_LOG(ERROR, "sandbox launcher exited without reporting a pid", launcher, sandboxId);
    result = -ECHILD;
  }

  if (result > 0) {
    KJ_LOG(INFO, "sandbox leader running", result, sandboxId);
  } else {
    KJ_LOG(ERROR, "couldn't create sandbox", sandboxId, strerror(-result));
  }
  return result;
}

void SandboxFactory::runLauncher(
    PidHandoff& handoff, kj::StringPtr sandboxId, kj::StringPtr netnsPath) {
  // Unsharing the PID namespace only affects children created from now on: we stay
  // addressable by our parent, and the next fork() produces pid 1 of the new namespace.
  int32_t result;
  if (unshare(CLONE_NEWIPC | CLONE_NEWUTS | CLONE_NEWPID) < 0) {
    int error = errno;
    KJ_LOG(ERROR, "couldn't unshare sandbox namespaces", sandboxId, strerror(error));
    result = -error;
  } else {
    result = forkLeader(handoff, sandboxId, netnsPath);
  }

  handoff.send(result);
  _exit(result > 0 ? 0 : 1);
}

}  // namespace sandboxer
