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

#include "test-util.h"
#include "util.h"
#include <kj/debug.h>
#include <sched.h>
#include <sys/wait.h>
#include <limits.h>
#include <stdlib.h>
#include <sys/ioctl.h>

namespace sandboxer {

bool namespacesAvailable() {
  pid_t child;
  KJ_SYSCALL(child = fork());
  if (child == 0) {
    _exit(unshare(CLONE_NEWIPC | CLONE_NEWUTS | CLONE_NEWPID) == 0 ? 0 : 1);
  }

  int status = waitForStatus(child);
  return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

kj::String namespaceOf(pid_t pid, kj::StringPtr type) {
  auto path = kj::str("/proc/", pid, "/ns/", type);
  char buffer[PATH_MAX];
  ssize_t n;
  KJ_SYSCALL(n = readlink(path.cStr(), buffer, sizeof(buffer) - 1), path);
  return kj::heapString(buffer, n);
}

kj::String innermostPid(pid_t pid) {
  for (auto& line: splitLines(readAll(kj::str("/proc/", pid, "/status")))) {
    if (line.startsWith("NSpid:")) {
      auto fields = trim(line.slice(strlen("NSpid:")));
      KJ_IF_MAYBE(pos, fields.findLast('\t')) {
        return trim(fields.slice(*pos + 1));
      } else KJ_IF_MAYBE(pos, fields.findLast(' ')) {
        return trim(fields.slice(*pos + 1));
      } else {
        return kj::mv(fields);
      }
    }
  }
  KJ_FAIL_ASSERT("no NSpid line in /proc/<pid>/status", pid);
}

kj::String commOf(pid_t pid) {
  return trim(readAll(kj::str("/proc/", pid, "/comm")));
}

void waitUntilDead(pid_t pid) {
  siginfo_t info;
  KJ_SYSCALL(waitid(P_PID, pid, &info, WEXITED | WNOWAIT), pid);
}

int waitForStatus(pid_t pid) {
  int status;
  KJ_SYSCALL(waitpid(pid, &status, 0), pid);
  return status;
}

// =======================================================================================

namespace {

void serveFakeRequests(int requestRead, int responseWrite) {
  for (;;) {
    kj::FixedArray<byte, REQUEST_FRAME_SIZE> frame;
    KJ_IF_MAYBE(e, kj::runCatchingExceptions([&]() { readExact(requestRead, frame); })) {
      _exit(isClosedChannel(*e) ? 0 : 2);
    }

    // Anything else on the pipe now would be a pipelined request.
    usleep(2000);
    int waiting = 0;
    KJ_SYSCALL(ioctl(requestRead, FIONREAD, &waiting));
    if (waiting != 0) _exit(3);

    auto request = decodeForkRequest(frame);
    writeExact(responseWrite, encodePid(strtol(request.sandboxId.cStr(), nullptr, 10)));
  }
}

}  // namespace

FakeSandboxParent::FakeSandboxParent() {
  auto requests = Pipe::make();
  auto responses = Pipe::make();

  KJ_SYSCALL(pid = fork());
  if (pid == 0) {
    KJ_DEFER(_exit(1));
    requests.writeEnd = nullptr;
    responses.readEnd = nullptr;
    serveFakeRequests(requests.readEnd, responses.writeEnd);
  }

  requests.readEnd = nullptr;
  responses.writeEnd = nullptr;
  handle = kj::heap<SandboxParent>(pid, kj::mv(requests.writeEnd), kj::mv(responses.readEnd));
}

int FakeSandboxParent::close() {
  handle = nullptr;
  return waitForStatus(pid);
}

}  // namespace sandboxer
