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
#include "exit-notifier.h"
#include <kj/test.h>
#include <kj/debug.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <signal.h>
#include <errno.h>
#include <string.h>
#include "test-util.h"

namespace sandboxer {
namespace {

void becomeSubreaper() {
  // Sandbox leaders outlive their launcher; we want them back so we can check on them.
  KJ_SYSCALL(prctl(PR_SET_CHILD_SUBREAPER, 1, 0, 0, 0));
}

void reapLauncher(pid_t leader) {
  // The leader is still running, so the only child that can terminate is the launcher.
  int status;
  pid_t pid;
  KJ_SYSCALL(pid = waitpid(-1, &status, 0));
  KJ_EXPECT(pid != leader);
  KJ_EXPECT(WIFEXITED(status) && WEXITSTATUS(status) == 0, status);
}

void reapEverything() {
  // Only call when every remaining child is about to terminate.
  for (;;) {
    int status;
    pid_t pid = waitpid(-1, &status, 0);
    if (pid < 0) {
      if (errno == EINTR) continue;
      KJ_ASSERT(errno == ECHILD, strerror(errno));
      return;
    }
  }
}

void killLeader(pid_t leader) {
  KJ_SYSCALL(kill(leader, SIGKILL));
  int status = waitForStatus(leader);
  KJ_EXPECT(WIFSIGNALED(status) && WTERMSIG(status) == SIGKILL, status);
}

KJ_TEST("PidHandoff carries one value") {
  auto handoff = PidHandoff::make();

  pid_t child;
  KJ_SYSCALL(child = fork());
  if (child == 0) {
    KJ_DEFER(_exit(1));
    handoff.closeReadEnd();
    handoff.send(-ENOENT);
    _exit(0);
  }
  handoff.closeWriteEnd();

  KJ_EXPECT(handoff.receive() == -ENOENT);
  waitForStatus(child);
}

KJ_TEST("PidHandoff reports a writer that exits without sending") {
  auto handoff = PidHandoff::make();

  pid_t child;
  KJ_SYSCALL(child = fork());
  if (child == 0) _exit(0);
  handoff.closeWriteEnd();

  KJ_IF_MAYBE(e, kj::runCatchingExceptions([&]() { handoff.receive(); })) {
    KJ_EXPECT(e->getType() == kj::Exception::Type::DISCONNECTED, *e);
  } else {
    KJ_FAIL_EXPECT("receive() should have failed");
  }
  waitForStatus(child);
}

KJ_TEST("SandboxFactory without the right to unshare") {
  if (namespacesAvailable()) return;

  becomeSubreaper();
  SandboxFactory factory;
  int32_t result;
  {
    KJ_EXPECT_LOG(ERROR, "couldn't create sandbox");
    result = factory.create("unprivileged", "");
  }
  KJ_EXPECT(result < 0, result);
  reapEverything();
}

KJ_TEST("SandboxFactory anchors a namespace set") {
  if (!namespacesAvailable()) {
    KJ_LOG(WARNING, "can't unshare namespaces here; skipping");
    return;
  }

  becomeSubreaper();
  SandboxFactory factory;
  pid_t leader = factory.create("abc", "");
  KJ_ASSERT(leader > 0, leader);
  reapLauncher(leader);

  KJ_EXPECT(leader != 1);
  KJ_EXPECT(kill(leader, 0) == 0);
  KJ_EXPECT(innermostPid(leader) == "1");
  KJ_EXPECT(commOf(leader) == "[sandbox-abc]");

  pid_t self = getpid();
  KJ_EXPECT(namespaceOf(leader, "pid") != namespaceOf(self, "pid"));
  KJ_EXPECT(namespaceOf(leader, "ipc") != namespaceOf(self, "ipc"));
  KJ_EXPECT(namespaceOf(leader, "uts") != namespaceOf(self, "uts"));
  KJ_EXPECT(namespaceOf(leader, "net") == namespaceOf(self, "net"));
  KJ_EXPECT(namespaceOf(leader, "mnt") == namespaceOf(self, "mnt"));

  // Still running after a while: the leader waits to be killed.
  usleep(50000);
  KJ_EXPECT(kill(leader, 0) == 0);
  int status;
  KJ_EXPECT(waitpid(leader, &status, WNOHANG) == 0);

  killLeader(leader);
}

KJ_TEST("SandboxFactory gives each sandbox its own namespaces") {
  if (!namespacesAvailable()) return;

  becomeSubreaper();
  SandboxFactory factory;
  pid_t first = factory.create("first", "");
  KJ_ASSERT(first > 0, first);
  reapLauncher(first);
  pid_t second = factory.create("second", "");
  KJ_ASSERT(second > 0, second);
  reapLauncher(second);

  KJ_EXPECT(first != second);
  KJ_EXPECT(namespaceOf(first, "pid") != namespaceOf(second, "pid"));
  KJ_EXPECT(namespaceOf(first, "ipc") != namespaceOf(second, "ipc"));
  KJ_EXPECT(namespaceOf(first, "uts") != namespaceOf(second, "uts"));

  killLeader(first);
  killLeader(second);
}

KJ_TEST("SandboxFactory joins a network namespace") {
  if (!namespacesAvailable()) return;

  becomeSubreaper();
  pid_t self = getpid();
  SandboxFactory factory;
  pid_t leader = factory.create("net", kj::str("/proc/", self, "/ns/net"));
  KJ_ASSERT(leader > 0, leader);
  reapLauncher(leader);

  KJ_EXPECT(namespaceOf(leader, "net") == namespaceOf(self, "net"));
  KJ_EXPECT(namespaceOf(leader, "pid") != namespaceOf(self, "pid"));

  killLeader(leader);
}

KJ_TEST("SandboxFactory reports a missing network namespace") {
  if (!namespacesAvailable()) return;

  becomeSubreaper();
  SandboxFactory factory;
  int32_t result;
  {
    KJ_EXPECT_LOG(ERROR, "couldn't create sandbox");
    result = factory.create("nonet", "/nonexistent/netns");
  }
  KJ_EXPECT(result == -ENOENT, result);

  // The launcher and the leader both gave up.
  reapEverything();
}

KJ_TEST("killed sandbox leader is reported with exit code 137") {
  if (!namespacesAvailable()) return;

  becomeSubreaper();
  kj::UnixEventPort::captureSignal(SIGCHLD);
  kj::UnixEventPort port;
  kj::EventLoop loop(port);
  kj::WaitScope waitScope(loop);

  SandboxFactory factory;
  pid_t leader = factory.create("doomed", "");
  KJ_ASSERT(leader > 0, leader);
  reapLauncher(leader);

  ProcessMonitor monitor;
  ExitNotifier notifier(port, monitor);
  auto watching = notifier.run(kj::arrayPtr(ExitNotifier::DEFAULT_SIGNALS, 1))
      .eagerlyEvaluate([](kj::Exception&& e) { KJ_LOG(ERROR, e); });

  auto exitCode = monitor.subscribe(leader);
  KJ_SYSCALL(kill(leader, SIGKILL));
  KJ_EXPECT(exitCode.wait(waitScope) == 137);
  KJ_EXPECT(kill(leader, 0) < 0 && errno == ESRCH);
}

}  // namespace
}  // namespace sandboxer
