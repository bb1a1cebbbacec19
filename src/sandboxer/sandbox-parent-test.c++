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
#include <kj/test.h>
#include <kj/debug.h>
#include <kj/thread.h>
#include <kj/vector.h>
#include <sys/wait.h>
#include <sys/resource.h>
#include <unistd.h>
#include <string.h>
#include <signal.h>
#include <stdlib.h>
#include <errno.h>
#include "test-util.h"

namespace sandboxer {
namespace {

KJ_TEST("forkSandbox requests are answered in order, one at a time") {
  FakeSandboxParent fake;
  auto& parent = fake.get();

  kj::Vector<pid_t> expected[2];
  kj::Vector<pid_t> received[2];
  {
    auto work = [&](uint n) {
      for (uint i = 0; i < 20; i++) {
        pid_t id = 1000 * (n + 1) + i;
        expected[n].add(id);
        received[n].add(parent.forkSandbox(kj::str(id), ""));
      }
    };
    kj::Thread first([&]() { work(0); });
    kj::Thread second([&]() { work(1); });
  }

  for (uint n = 0; n < 2; n++) {
    KJ_ASSERT(received[n].size() == expected[n].size());
    for (uint i = 0; i < received[n].size(); i++) {
      KJ_EXPECT(received[n][i] == expected[n][i], n, i);
    }
  }

  int status = fake.close();
  KJ_EXPECT(WIFEXITED(status) && WEXITSTATUS(status) == 0, status);
}

KJ_TEST("forkSandbox turns negative answers into errors") {
  FakeSandboxParent fake;
  KJ_EXPECT_THROW_MESSAGE("forkSandbox()", fake.get().forkSandbox(kj::str(-ENOENT), ""));

  // The channel is still usable.
  KJ_EXPECT(fake.get().forkSandbox("77", "") == 77);
  fake.close();
}

KJ_TEST("forkSandbox validates before sending") {
  FakeSandboxParent fake;
  auto longId = kj::heapString(SANDBOX_ID_SIZE + 1);
  memset(longId.begin(), '9', longId.size());
  KJ_EXPECT_THROW_MESSAGE("sandbox id too long", fake.get().forkSandbox(longId, ""));
  KJ_EXPECT(fake.get().forkSandbox("5", "") == 5);
  fake.close();
}

KJ_TEST("forkSandbox reports a sandbox parent that went away") {
  struct sigaction ignore;
  memset(&ignore, 0, sizeof(ignore));
  ignore.sa_handler = SIG_IGN;
  struct sigaction oldAction;
  KJ_SYSCALL(sigaction(SIGPIPE, &ignore, &oldAction));
  KJ_DEFER(sigaction(SIGPIPE, &oldAction, nullptr));

  FakeSandboxParent fake;
  KJ_SYSCALL(kill(fake.get().getPid(), SIGKILL));
  waitUntilDead(fake.get().getPid());

  KJ_IF_MAYBE(e, kj::runCatchingExceptions([&]() { fake.get().forkSandbox("1", ""); })) {
    // Either the request hit a closed pipe or the response never came.
    KJ_EXPECT(e->getType() == kj::Exception::Type::DISCONNECTED, *e);
  } else {
    KJ_FAIL_EXPECT("forkSandbox() should have failed");
  }

  int status = fake.close();
  KJ_EXPECT(WIFSIGNALED(status) && WTERMSIG(status) == SIGKILL, status);
}

// ---------------------------------------------------------------------------------------

KJ_TEST("sandbox parent keeps serving after a failed request") {
  auto parent = forkSandboxParent();
  pid_t parentPid = parent->getPid();

  // Without privileges unshare() fails; with them, the network namespace can't be found.
  // Either way the failure must come back as an answer, not as a dead sandbox parent.
  KJ_EXPECT_THROW_MESSAGE("forkSandbox()", parent->forkSandbox("bad", "/nonexistent/netns"));
  KJ_EXPECT(kill(parentPid, 0) == 0);
  KJ_EXPECT_THROW_MESSAGE("forkSandbox()", parent->forkSandbox("bad2", "/nonexistent/netns"));
  KJ_EXPECT(kill(parentPid, 0) == 0);

  parent = nullptr;
  int status = waitForStatus(parentPid);
  KJ_EXPECT(WIFEXITED(status) && WEXITSTATUS(status) == 0, status);
}

KJ_TEST("sandbox parent exits cleanly when the channel closes") {
  auto parent = forkSandboxParent();
  pid_t parentPid = parent->getPid();
  KJ_EXPECT(kill(parentPid, 0) == 0);

  // The kernel truncates the short name to 15 bytes.
  for (uint i = 0; i < 100 && commOf(parentPid) != "[sandbox-parent"; i++) {
    usleep(10000);
  }
  KJ_EXPECT(commOf(parentPid) == "[sandbox-parent");

  parent = nullptr;
  int status = waitForStatus(parentPid);
  KJ_EXPECT(WIFEXITED(status) && WEXITSTATUS(status) == 0, status);
}

KJ_TEST("sandbox parent fails on a malformed request frame") {
  auto requests = Pipe::make();
  auto responses = Pipe::make();

  pid_t child;
  KJ_SYSCALL(child = fork());
  if (child == 0) {
    KJ_DEFER(_exit(1));  // Do not under any circumstances return from this stack frame!
    requests.writeEnd = nullptr;
    responses.readEnd = nullptr;
    _exit(serveSandboxParent(kj::mv(requests.readEnd), kj::mv(responses.writeEnd)));
  }

  requests.readEnd = nullptr;
  responses.writeEnd = nullptr;

  // No NUL anywhere, so the network namespace path never ends.
  kj::FixedArray<byte, REQUEST_FRAME_SIZE> frame;
  memset(frame.begin(), 'x', frame.size());
  writeExact(requests.writeEnd, frame.asPtr());

  int status = waitForStatus(child);
  KJ_EXPECT(WIFEXITED(status) && WEXITSTATUS(status) == 1, status);
}

KJ_TEST("sandbox creation errors are answered by exception type") {
  KJ_EXPECT(errnoForException(KJ_EXCEPTION(OVERLOADED, "out of descriptors")) == -EAGAIN);
  KJ_EXPECT(errnoForException(KJ_EXCEPTION(DISCONNECTED, "handoff closed")) == -EPIPE);
  KJ_EXPECT(errnoForException(KJ_EXCEPTION(UNIMPLEMENTED, "no pidfd")) == -ENOSYS);
  KJ_EXPECT(errnoForException(KJ_EXCEPTION(FAILED, "something else")) == -EIO);
}

KJ_TEST("sandbox parent answers EAGAIN when it runs out of descriptors") {
  auto requests = Pipe::make();
  auto responses = Pipe::make();

  pid_t child;
  KJ_SYSCALL(child = fork());
  if (child == 0) {
    KJ_DEFER(_exit(1));  // Do not under any circumstances return from this stack frame!
    requests.writeEnd = nullptr;
    responses.readEnd = nullptr;

    struct rlimit limit;
    KJ_SYSCALL(getrlimit(RLIMIT_NOFILE, &limit));
    if (limit.rlim_max > 64) limit.rlim_cur = 64;
    KJ_SYSCALL(setrlimit(RLIMIT_NOFILE, &limit));
    while (dup(requests.readEnd) >= 0) {}
    if (errno != EMFILE) _exit(2);

    // The first pipe the factory needs can't be made.
    SandboxParentServer server(kj::mv(requests.readEnd), kj::mv(responses.writeEnd));
    server.serveOne();
    _exit(0);
  }

  requests.readEnd = nullptr;
  responses.writeEnd = nullptr;

  auto request = encodeForkRequest("abc", "");
  writeExact(requests.writeEnd, request.asPtr());
  kj::FixedArray<byte, RESPONSE_FRAME_SIZE> response;
  readExact(responses.readEnd, response.asPtr());
  KJ_EXPECT(decodePid(response.asPtr()) == -EAGAIN);

  int status = waitForStatus(child);
  KJ_EXPECT(WIFEXITED(status) && WEXITSTATUS(status) == 0, status);
}

KJ_TEST("sandbox parent creates sandboxes") {
  if (!namespacesAvailable()) {
    KJ_LOG(WARNING, "can't unshare namespaces here; skipping");
    return;
  }

  auto parent = forkSandboxParent();
  pid_t parentPid = parent->getPid();

  pid_t first = parent->forkSandbox("abc", "");
  pid_t second = parent->forkSandbox("def", kj::str("/proc/", getpid(), "/ns/net"));
  KJ_EXPECT(first > 0);
  KJ_EXPECT(second > 0);
  KJ_EXPECT(first != second);

  KJ_EXPECT(kill(first, 0) == 0);
  KJ_EXPECT(innermostPid(first) == "1");
  KJ_EXPECT(commOf(first) == "[sandbox-abc]");
  KJ_EXPECT(namespaceOf(first, "pid") != namespaceOf(getpid(), "pid"));
  KJ_EXPECT(namespaceOf(second, "net") == namespaceOf(getpid(), "net"));

  // Leaders are the sandbox parent's to reap.
  KJ_SYSCALL(kill(first, SIGKILL));
  KJ_SYSCALL(kill(second, SIGKILL));
  for (uint i = 0; i < 100; i++) {
    if (kill(first, 0) < 0 && kill(second, 0) < 0) break;
    usleep(10000);
  }
  KJ_EXPECT(kill(first, 0) < 0 && errno == ESRCH);
  KJ_EXPECT(kill(second, 0) < 0 && errno == ESRCH);

  // A failure doesn't stop it.
  KJ_EXPECT_THROW_MESSAGE("forkSandbox()", parent->forkSandbox("bad", "/nonexistent/netns"));
  pid_t third = parent->forkSandbox("ghi", "");
  KJ_EXPECT(third > 0);
  KJ_SYSCALL(kill(third, SIGKILL));
  for (uint i = 0; i < 100 && kill(third, 0) == 0; i++) {
    usleep(10000);
  }

  parent = nullptr;
  int status = waitForStatus(parentPid);
  KJ_EXPECT(WIFEXITED(status) && WEXITSTATUS(status) == 0, status);
}

}  // namespace
}  // namespace sandboxer
