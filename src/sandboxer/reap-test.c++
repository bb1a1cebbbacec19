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

#include "reap.h"
#include <kj/test.h>
#include <kj/debug.h>
#include <kj/vector.h>
#include <signal.h>
#include <unistd.h>
#include "test-util.h"

namespace sandboxer {
namespace {

struct Reaped {
  pid_t pid;
  int exitCode;
};

kj::Vector<Reaped> reapEverything() {
  kj::Vector<Reaped> result;
  int error = reapAll([&](pid_t pid, int exitCode) {
    result.add(Reaped { pid, exitCode });
  });
  KJ_EXPECT(error == 0, error);
  return result;
}

int exitCodeOf(const kj::Vector<Reaped>& reaped, pid_t pid) {
  // -1 if `pid` wasn't reaped.
  for (auto& r: reaped) {
    if (r.pid == pid) return r.exitCode;
  }
  return -1;
}

KJ_TEST("reapAll reports exit statuses") {
  pid_t child;
  KJ_SYSCALL(child = fork());
  if (child == 0) _exit(7);

  waitUntilDead(child);
  auto reaped = reapEverything();
  KJ_EXPECT(exitCodeOf(reaped, child) == 7);
}

KJ_TEST("reapAll reports killed children as 128 + signal") {
  pid_t child;
  KJ_SYSCALL(child = fork());
  if (child == 0) {
    for (;;) pause();
  }

  KJ_SYSCALL(kill(child, SIGKILL));
  waitUntilDead(child);
  auto reaped = reapEverything();
  KJ_EXPECT(exitCodeOf(reaped, child) == 137);
}

KJ_TEST("reapAll collects several children in one pass") {
  pid_t children[3];
  for (int i = 0; i < 3; i++) {
    KJ_SYSCALL(children[i] = fork());
    if (children[i] == 0) _exit(i + 1);
  }
  for (auto child: children) {
    waitUntilDead(child);
  }

  auto reaped = reapEverything();
  for (int i = 0; i < 3; i++) {
    KJ_EXPECT(exitCodeOf(reaped, children[i]) == i + 1, children[i]);
  }
}

KJ_TEST("reapAll leaves running children alone") {
  pid_t child;
  KJ_SYSCALL(child = fork());
  if (child == 0) {
    for (;;) pause();
  }
  KJ_DEFER({
    kill(child, SIGKILL);
    waitForStatus(child);
  });

  auto reaped = reapEverything();
  KJ_EXPECT(exitCodeOf(reaped, child) == -1);
}

KJ_TEST("reapOne with nothing to reap") {
  reapEverything();
  KJ_EXPECT(reapOne().is<ReapNoChildren>());
  KJ_EXPECT(reapEverything().size() == 0);
}

}  // namespace
}  // namespace sandboxer
