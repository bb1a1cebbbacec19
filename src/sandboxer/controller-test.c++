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
#include <kj/test.h>
#include <kj/debug.h>
#include <sys/wait.h>
#include <signal.h>
#include <string.h>
#include <unistd.h>
#include "test-util.h"

namespace sandboxer {
namespace {

pid_t forkSleeper() {
  // Stands in for a sandbox leader so that stop() has something real to signal.
  pid_t child;
  KJ_SYSCALL(child = fork());
  if (child == 0) {
    for (;;) pause();
  }
  return child;
}

KJ_TEST("SandboxController create and stop") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  FakeSandboxParent fake;
  BlockingWorker worker;

  SandboxController::Client client = kj::heap<SandboxControllerImpl>(fake.get(), worker);

  pid_t sleeper = forkSleeper();
  {
    auto req = client.createRequest();
    req.setId(kj::str(sleeper));
    req.setNetns("");
    KJ_EXPECT(req.send().wait(waitScope).getPid() == sleeper);
  }

  {
    auto req = client.stopRequest();
    req.setPid(sleeper);
    req.setSignal(SIGTERM);
    req.send().wait(waitScope);
  }
  int status = waitForStatus(sleeper);
  KJ_EXPECT(WIFSIGNALED(status) && WTERMSIG(status) == SIGTERM, status);

  // Forgotten once stopped.
  {
    auto req = client.stopRequest();
    req.setPid(sleeper);
    KJ_EXPECT_THROW_MESSAGE("not a sandbox created here", req.send().wait(waitScope));
  }

  status = fake.close();
  KJ_EXPECT(WIFEXITED(status) && WEXITSTATUS(status) == 0, status);
}

KJ_TEST("SandboxController stop defaults to SIGKILL") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  FakeSandboxParent fake;
  BlockingWorker worker;

  SandboxController::Client client = kj::heap<SandboxControllerImpl>(fake.get(), worker);

  pid_t sleeper = forkSleeper();
  {
    auto req = client.createRequest();
    req.setId(kj::str(sleeper));
    req.send().wait(waitScope);
  }
  {
    auto req = client.stopRequest();
    req.setPid(sleeper);
    req.send().wait(waitScope);
  }
  int status = waitForStatus(sleeper);
  KJ_EXPECT(WIFSIGNALED(status) && WTERMSIG(status) == SIGKILL, status);

  fake.close();
}

pid_t createThrough(SandboxController::Client& client, pid_t pid, kj::WaitScope& waitScope) {
  // The fake sandbox parent answers with the id it was given.
  auto req = client.createRequest();
  req.setId(kj::str(pid));
  return req.send().wait(waitScope).getPid();
}

void stopThrough(SandboxController::Client& client, pid_t pid, int signo,
                 kj::WaitScope& waitScope) {
  auto req = client.stopRequest();
  req.setPid(pid);
  req.setSignal(signo);
  req.send().wait(waitScope);
}

bool stillRunning(pid_t pid) {
  int status;
  pid_t result;
  KJ_SYSCALL(result = waitpid(pid, &status, WNOHANG));
  return result == 0;
}

KJ_TEST("SandboxController keeps a sandbox when stop is given a bad signal") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  FakeSandboxParent fake;
  BlockingWorker worker;

  SandboxController::Client client = kj::heap<SandboxControllerImpl>(fake.get(), worker);

  pid_t sleeper = forkSleeper();
  KJ_ASSERT(createThrough(client, sleeper, waitScope) == sleeper);

  KJ_EXPECT_THROW_MESSAGE("invalid signal", stopThrough(client, sleeper, 999, waitScope));
  KJ_EXPECT_THROW_MESSAGE("invalid signal", stopThrough(client, sleeper, -1, waitScope));
  KJ_EXPECT(stillRunning(sleeper));

  // Still known, so a proper stop goes through.
  stopThrough(client, sleeper, 0, waitScope);
  int status = waitForStatus(sleeper);
  KJ_EXPECT(WIFSIGNALED(status) && WTERMSIG(status) == SIGKILL, status);

  fake.close();
}

KJ_TEST("SandboxController forgets sandboxes that exited on their own") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  FakeSandboxParent fake;
  BlockingWorker worker;

  auto impl = kj::heap<SandboxControllerImpl>(fake.get(), worker);
  auto& controller = *impl;
  SandboxController::Client client = kj::mv(impl);

  pid_t first = forkSleeper();
  KJ_ASSERT(createThrough(client, first, waitScope) == first);
  KJ_EXPECT(controller.manages(first));

  // Killed behind the controller's back.
  KJ_SYSCALL(kill(first, SIGKILL));
  waitForStatus(first);

  // Stopping it anyway is harmless, and it is forgotten afterwards.
  stopThrough(client, first, SIGTERM, waitScope);
  KJ_EXPECT(!controller.manages(first));

  pid_t second = forkSleeper();
  KJ_ASSERT(createThrough(client, second, waitScope) == second);
  KJ_SYSCALL(kill(second, SIGKILL));
  waitForStatus(second);

  // The next create notices that the second leader is gone.
  pid_t third = forkSleeper();
  KJ_ASSERT(createThrough(client, third, waitScope) == third);
  KJ_EXPECT(!controller.manages(second));
  KJ_EXPECT(controller.manages(third));

  stopThrough(client, third, 0, waitScope);
  waitForStatus(third);
  fake.close();
}

KJ_TEST("SandboxController tracks a sandbox whose creator went away") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  FakeSandboxParent fake;
  BlockingWorker worker;

  auto impl = kj::heap<SandboxControllerImpl>(fake.get(), worker);
  auto& controller = *impl;
  SandboxController::Client client = kj::mv(impl);

  pid_t sleeper = forkSleeper();
  {
    auto req = client.createRequest();
    req.setId(kj::str(sleeper));
    auto abandoned = req.send();
    waitScope.poll();
    // Dropping `abandoned` cancels the call.
  }

  for (uint i = 0; i < 200 && !controller.manages(sleeper); i++) {
    usleep(5000);
    waitScope.poll();
  }
  KJ_EXPECT(controller.manages(sleeper));

  stopThrough(client, sleeper, 0, waitScope);
  int status = waitForStatus(sleeper);
  KJ_EXPECT(WIFSIGNALED(status) && WTERMSIG(status) == SIGKILL, status);

  fake.close();
}

KJ_TEST("SandboxController rejects bad requests") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  FakeSandboxParent fake;
  BlockingWorker worker;

  SandboxController::Client client = kj::heap<SandboxControllerImpl>(fake.get(), worker);

  {
    auto req = client.createRequest();
    auto longId = kj::heapString(SANDBOX_ID_SIZE + 1);
    memset(longId.begin(), '1', longId.size());
    req.setId(longId);
    KJ_EXPECT_THROW_MESSAGE("sandbox id too long", req.send().wait(waitScope));
  }

  {
    // The sandbox parent answers with -ENOENT.
    auto req = client.createRequest();
    req.setId(kj::str(-ENOENT));
    req.setNetns("/nonexistent/netns");
    KJ_EXPECT_THROW_MESSAGE("forkSandbox()", req.send().wait(waitScope));
  }

  {
    auto req = client.stopRequest();
    req.setPid(getpid());
    KJ_EXPECT_THROW_MESSAGE("not a sandbox created here", req.send().wait(waitScope));
  }

  int status = fake.close();
  KJ_EXPECT(WIFEXITED(status) && WEXITSTATUS(status) == 0, status);
}

}  // namespace
}  // namespace sandboxer
