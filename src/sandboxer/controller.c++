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

#include "controller.h"
#include <kj/debug.h>
#include <sys/syscall.h>
#include <poll.h>
#include <signal.h>
#include <errno.h>
#include <string.h>
#include <unistd.h>

namespace sandboxer {

kj::Promise<void> SandboxControllerImpl::create(CreateContext context) {
  auto params = context.getParams();
  auto id = kj::heapString(params.getId());
  auto netns = kj::heapString(params.getNetns());
  validateForkRequest(id, netns);
  context.releaseParams();

  // Once asked, the sandbox parent creates the leader whether or not our caller is still
  // waiting, so the pid is recorded by a task of our own rather than by the call.
  const SandboxParent& parent = this->parent;
  auto created = worker.run([&parent, KJ_MVCAP(id), KJ_MVCAP(netns)]() {
    return parent.forkSandbox(id, netns);
  }).then([this](pid_t pid) {
    track(pid);
    return pid;
  }).fork();

  tasks.add(created.addBranch().ignoreResult());
  return created.addBranch().then([context](pid_t pid) mutable {
    context.getResults().setPid(pid);
  });
}

kj::Promise<void> SandboxControllerImpl::stop(StopContext context) {
  auto params = context.getParams();
  pid_t pid = params.getPid();
  int signo = params.getSignal() == 0 ? SIGKILL : params.getSignal();
  KJ_REQUIRE(signo > 0 && signo < NSIG, "invalid signal", signo);

  auto iter = sandboxes.find(pid);
  KJ_REQUIRE(iter != sandboxes.end(), "not a sandbox created here", pid);

  if (syscall(SYS_pidfd_send_signal, static_cast<int>(iter->second), signo, nullptr, 0) < 0) {
    int error = errno;
    if (error != ESRCH) {
      KJ_FAIL_SYSCALL("pidfd_send_signal(sandbox)", error, pid, signo);
    }
    KJ_LOG(INFO, "sandbox leader already gone", pid);
  }

  sandboxes.erase(iter);
  return kj::READY_NOW;
}

void SandboxControllerImpl::track(pid_t pid) {
  forgetExited();

  int fd = syscall(SYS_pidfd_open, pid, 0);
  if (fd < 0) {
    int error = errno;
    if (error != ESRCH) {
      KJ_FAIL_SYSCALL("pidfd_open(sandbox)", error, pid);
    }
    KJ_LOG(WARNING, "sandbox leader exited before it could be tracked", pid);
    return;
  }

  KJ_LOG(INFO, "tracking sandbox leader", pid);
  sandboxes.insert_or_assign(pid, kj::AutoCloseFd(fd));
}

void SandboxControllerImpl::forgetExited() {
  // A pidfd polls readable once its process has terminated.
  for (auto iter = sandboxes.begin(); iter != sandboxes.end();) {
    struct pollfd pfd;
    memset(&pfd, 0, sizeof(pfd));
    pfd.fd = iter->second;
    pfd.events = POLLIN;

    int n;
    KJ_SYSCALL(n = poll(&pfd, 1, 0));
    if (n > 0) {
      KJ_LOG(INFO, "sandbox leader exited without being stopped", iter->first);
      iter = sandboxes.erase(iter);
    } else {
      ++iter;
    }
  }
}

void SandboxControllerImpl::taskFailed(kj::Exception&& exception) {
  // The caller of create() received the same exception, if it was still listening.
  KJ_LOG(WARNING, "sandbox creation failed", exception);
}

}  // namespace sandboxer
