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

#ifndef SANDBOXER_TEST_UTIL_H_
#define SANDBOXER_TEST_UTIL_H_
// Helpers shared by the sandboxer tests.

#include <kj/string.h>
#include <kj/memory.h>
#include <sys/types.h>
#include "sandbox-parent.h"

namespace sandboxer {

bool namespacesAvailable();
// True if this process may unshare IPC, UTS and PID namespaces (i.e. we are running with
// CAP_SYS_ADMIN). Tests that need real sandboxes return early otherwise.

kj::String namespaceOf(pid_t pid, kj::StringPtr type);
// Target of /proc/<pid>/ns/<type>, e.g. "pid:[4026531836]".

kj::String innermostPid(pid_t pid);
// The last entry of the NSpid line in /proc/<pid>/status: the pid as seen inside the process's
// own PID namespace.

kj::String commOf(pid_t pid);
// Contents of /proc/<pid>/comm without the trailing newline.

void waitUntilDead(pid_t pid);
// Blocks until the child `pid` has terminated, without reaping it.

int waitForStatus(pid_t pid);
// waitpid(pid, 0) and return the raw status.

class FakeSandboxParent {
  // A child process speaking the sandbox parent's protocol. Answers each request with the
  // sandbox id parsed as a number, after a short delay. Exits with status 3 if a request arrives
  // before the previous one was answered.

public:
  FakeSandboxParent();
  KJ_DISALLOW_COPY(FakeSandboxParent);

  const SandboxParent& get() { return *handle; }

  int close();
  // Drop the handle and return the fake's wait status.

private:
  pid_t pid;
  kj::Own<SandboxParent> handle;
};

}  // namespace sandboxer

#endif // SANDBOXER_TEST_UTIL_H_
