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

#include "exit-notifier.h"
#include <kj/test.h>
#include <kj/debug.h>
#include <sys/wait.h>
#include <string.h>
#include "test-util.h"

namespace sandboxer {
namespace {

class RecordingMonitor final: public ExitMonitor {
public:
  struct Event {
    pid_t pid;
    int exitCode;
  };
  kj::Vector<Event> events;

  kj::Promise<void> notifyByPid(pid_t pid, int exitCode) override {
    events.add(Event { pid, exitCode });
    return kj::READY_NOW;
  }
};

class FailingMonitor final: public ExitMonitor {
public:
  uint calls = 0;

  kj::Promise<void> notifyByPid(pid_t pid, int exitCode) override {
    ++calls;
    if (calls == 1) {
      KJ_FAIL_ASSERT("monitor is gone", pid);
    }
    return KJ_EXCEPTION(DISCONNECTED, "monitor is gone", pid);
  }
};

siginfo_t makeSiginfo(int signo) {
  siginfo_t info;
  memset(&info, 0, sizeof(info));
  info.si_signo = signo;
  return info;
}

pid_t forkExiting(int status) {
  pid_t child;
  KJ_SYSCALL(child = fork());
  if (child == 0) _exit(status);
  waitUntilDead(child);
  return child;
}

KJ_TEST("ProcessMonitor resumes every subscriber") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);

  ProcessMonitor monitor;
  auto first = monitor.subscribe(123);
  auto second = monitor.subscribe(123);
  auto other = monitor.subscribe(456);

  monitor.notifyByPid(123, 137).wait(waitScope);
  KJ_EXPECT(first.wait(waitScope) == 137);
  KJ_EXPECT(second.wait(waitScope) == 137);
  KJ_EXPECT(!other.poll(waitScope));

  // Nobody is waiting any more.
  monitor.notifyByPid(123, 0).wait(waitScope);
  monitor.notifyByPid(789, 1).wait(waitScope);
}

KJ_TEST("ExitNotifier reports each reaped child once") {
  kj::UnixEventPort port;
  kj::EventLoop loop(port);
  kj::WaitScope waitScope(loop);

  RecordingMonitor monitor;
  ExitNotifier notifier(port, monitor);

  pid_t exited = forkExiting(3);
  pid_t killed;
  KJ_SYSCALL(killed = fork());
  if (killed == 0) {
    for (;;) pause();
  }
  KJ_SYSCALL(kill(killed, SIGTERM));
  waitUntilDead(killed);

  notifier.handleSignal(makeSiginfo(SIGCHLD)).wait(waitScope);
  // A second SIGCHLD finds nothing left.
  notifier.handleSignal(makeSiginfo(SIGCHLD)).wait(waitScope);

  // Orphans left behind by earlier tests may show up too.
  uint seenExited = 0, seenKilled = 0;
  for (auto& event: monitor.events) {
    if (event.pid == exited) {
      ++seenExited;
      KJ_EXPECT(event.exitCode == 3);
    } else if (event.pid == killed) {
      ++seenKilled;
      KJ_EXPECT(event.exitCode == 128 + SIGTERM);
    }
  }
  KJ_EXPECT(seenExited == 1);
  KJ_EXPECT(seenKilled == 1);
}

KJ_TEST("ExitNotifier reaps children that exited before it was watching") {
  kj::UnixEventPort port;
  kj::EventLoop loop(port);
  kj::WaitScope waitScope(loop);

  // Its SIGCHLD is long gone by the time anyone subscribes.
  pid_t early = forkExiting(5);

  ProcessMonitor monitor;
  ExitNotifier notifier(port, monitor);
  auto exited = monitor.subscribe(early);
  KJ_EXPECT(!exited.poll(waitScope));

  notifier.reapChildren().wait(waitScope);
  KJ_EXPECT(exited.wait(waitScope) == 5);
}

KJ_TEST("ExitNotifier keeps reaping when the monitor fails") {
  kj::UnixEventPort port;
  kj::EventLoop loop(port);
  kj::WaitScope waitScope(loop);

  FailingMonitor monitor;
  ExitNotifier notifier(port, monitor);

  forkExiting(0);
  forkExiting(1);

  {
    KJ_EXPECT_LOG(ERROR, "failed to send exit event");
    KJ_EXPECT_LOG(ERROR, "failed to send exit event");
    notifier.handleSignal(makeSiginfo(SIGCHLD)).wait(waitScope);
  }
  KJ_EXPECT(monitor.calls >= 2);
}

KJ_TEST("ExitNotifier records the first shutdown signal") {
  kj::UnixEventPort port;
  kj::EventLoop loop(port);
  kj::WaitScope waitScope(loop);

  RecordingMonitor monitor;
  ExitNotifier notifier(port, monitor);
  auto shutdown = notifier.onShutdown();
  KJ_EXPECT(!shutdown.poll(waitScope));
  KJ_EXPECT(notifier.getShutdownSignal() == nullptr);

  {
    KJ_EXPECT_LOG(WARNING, "ignoring unexpected signal");
    notifier.handleSignal(makeSiginfo(SIGUSR2)).wait(waitScope);
  }
  KJ_EXPECT(!shutdown.poll(waitScope));

  notifier.handleSignal(makeSiginfo(SIGTERM)).wait(waitScope);
  notifier.handleSignal(makeSiginfo(SIGINT)).wait(waitScope);
  KJ_EXPECT(shutdown.wait(waitScope) == SIGTERM);
  KJ_EXPECT(notifier.onShutdown().wait(waitScope) == SIGTERM);
  KJ_EXPECT(KJ_ASSERT_NONNULL(notifier.getShutdownSignal()) == SIGTERM);
  KJ_EXPECT(monitor.events.size() == 0);
}

KJ_TEST("ExitNotifier watches real signals") {
  kj::UnixEventPort::captureSignal(SIGCHLD);
  kj::UnixEventPort::captureSignal(SIGTERM);
  kj::UnixEventPort port;
  kj::EventLoop loop(port);
  kj::WaitScope waitScope(loop);

  ProcessMonitor monitor;
  ExitNotifier notifier(port, monitor);
  auto watching = notifier.run()
      .eagerlyEvaluate([](kj::Exception&& e) { KJ_LOG(ERROR, e); });

  pid_t child;
  KJ_SYSCALL(child = fork());
  if (child == 0) {
    usleep(10000);
    _exit(42);
  }
  KJ_EXPECT(monitor.subscribe(child).wait(waitScope) == 42);

  // SIGTERM is blocked and captured, so this only resolves onShutdown().
  KJ_SYSCALL(kill(getpid(), SIGTERM));
  KJ_EXPECT(notifier.onShutdown().wait(waitScope) == SIGTERM);
}

}  // namespace
}  // namespace sandboxer
