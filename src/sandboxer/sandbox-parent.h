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

#ifndef SANDBOXER_SANDBOX_PARENT_H_
#define SANDBOXER_SANDBOX_PARENT_H_
// The sandbox parent is a process forked from the main program at startup. It is the child
// subreaper of every sandbox, and the only process that forks sandbox leaders: the main program
// asks it for a new sandbox over a pair of pipes (see channel.h) and gets back the leader's pid.
//
// Forking from a small single-threaded process keeps the main program's threads, event loop
// and descriptors out of the sandboxes.

#include <kj/io.h>
#include <kj/memory.h>
#include <kj/mutex.h>
#include "channel.h"
#include "sandbox-factory.h"

namespace sandboxer {

class SandboxParent {
  // The main program's handle on the sandbox parent. Must stay alive for as long as sandboxes
  // may be created; destroying it closes the channel, which makes the sandbox parent exit.

public:
  SandboxParent(pid_t pid, kj::AutoCloseFd requestWrite, kj::AutoCloseFd responseRead);
  KJ_DISALLOW_COPY(SandboxParent);

  pid_t getPid() const { return pid; }

  pid_t forkSandbox(kj::StringPtr sandboxId, kj::StringPtr netnsPath) const;
  // Asks the sandbox parent to create a sandbox leader and returns its pid. Blocks until the
  // leader is running, so don't call this on an event loop thread (see BlockingWorker).
  //
  // Thread-safe. Requests are never pipelined: each caller holds the channel from writing its
  // request until it has read the response.

private:
  struct Channel {
    kj::AutoCloseFd requestWrite;
    kj::AutoCloseFd responseRead;
  };

  pid_t pid;
  kj::MutexGuarded<Channel> channel;
};

class SandboxParentServer {
  // The sandbox parent's end of the channel. Serves one request at a time.

public:
  SandboxParentServer(kj::AutoCloseFd requestRead, kj::AutoCloseFd responseWrite);
  KJ_DISALLOW_COPY(SandboxParentServer);

  ForkRequest receiveRequest();
  void sendResponse(int32_t pid);

  void serveOne();
  // Receive a request, create the sandbox, send the response. A sandbox that can't be created
  // is answered with -errno; only channel errors propagate.

  void run() KJ_NORETURN;
  // serveOne() forever. Exits by exception only, e.g. DISCONNECTED when the main program closes
  // its end of the request pipe.

private:
  kj::AutoCloseFd requestRead;
  kj::AutoCloseFd responseWrite;
  SandboxFactory factory;
};

int32_t errnoForException(const kj::Exception& exception);
// The negative errno that answers a request whose sandbox creation threw `exception`: -EAGAIN
// for OVERLOADED (e.g. out of descriptors or memory), -EPIPE for DISCONNECTED, -ENOSYS for
// UNIMPLEMENTED, and -EIO for anything else.

int serveSandboxParent(kj::AutoCloseFd requestRead, kj::AutoCloseFd responseWrite);
// Turns the calling process into a sandbox parent serving the given channel, and returns the
// status it should exit with: 0 once the main program closes the channel, 1 if the channel
// fails in any other way (e.g. a malformed request frame). Only call this in a process forked
// for the purpose; it becomes a child subreaper and takes over SIGCHLD.

void installReapHandler();
// Installs a SIGCHLD handler that reaps every terminated child. Children are logged only when
// INFO logging is enabled; wait errors always are.

kj::Own<SandboxParent> forkSandboxParent();
// Call this early in main(), before creating threads or capturing signals with
// kj::UnixEventPort. Forks the sandbox parent and returns the handle on it. The forked process
// never returns from this call.

}  // namespace sandboxer

#endif // SANDBOXER_SANDBOX_PARENT_H_
