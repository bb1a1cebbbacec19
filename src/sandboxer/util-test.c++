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

#include "util.h"
#include <kj/test.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <stdlib.h>
#include <string.h>
#include <errno.h>
#include "test-util.h"

namespace sandboxer {
namespace {

kj::String makeTempDir() {
  char path[] = "/tmp/sandboxer-test.XXXXXX";
  KJ_ASSERT(mkdtemp(path) != nullptr, strerror(errno));
  return kj::heapString(path);
}

template <typename Func>
kj::String captureStderr(Func&& func) {
  // Runs `func` in a child process and returns whatever it wrote to stderr.
  auto pipe = Pipe::make();

  pid_t child;
  KJ_SYSCALL(child = fork());
  if (child == 0) {
    KJ_DEFER(_exit(1));
    pipe.readEnd = nullptr;
    KJ_SYSCALL(dup2(pipe.writeEnd, STDERR_FILENO));
    pipe.writeEnd = nullptr;
    func();
    _exit(0);
  }
  pipe.writeEnd = nullptr;

  auto result = readAll(pipe.readEnd);
  int status = waitForStatus(child);
  KJ_EXPECT(WIFEXITED(status) && WEXITSTATUS(status) == 0, status);
  return result;
}

KJ_TEST("Pipe ends are close-on-exec") {
  auto pipe = Pipe::make();
  int flags;
  KJ_SYSCALL(flags = fcntl(pipe.readEnd, F_GETFD));
  KJ_EXPECT(flags & FD_CLOEXEC);
  KJ_SYSCALL(flags = fcntl(pipe.writeEnd, F_GETFD));
  KJ_EXPECT(flags & FD_CLOEXEC);
}

KJ_TEST("trim and splitLines") {
  KJ_EXPECT(trim(kj::StringPtr("  foo \t\n")) == "foo");
  KJ_EXPECT(trim(kj::StringPtr("   ")) == "");

  auto lines = splitLines("# comment\n  LISTEN=/run/x.sock  \n\n\tDIR = /run/x\n");
  KJ_ASSERT(lines.size() == 2);
  KJ_EXPECT(lines[0] == "LISTEN=/run/x.sock");
  KJ_EXPECT(lines[1] == "DIR = /run/x");
}

KJ_TEST("makeDirectories") {
  auto tmp = makeTempDir();
  auto nested = kj::str(tmp, "/a/b/c");

  makeDirectories(nested);
  struct stat stats;
  KJ_SYSCALL(stat(nested.cStr(), &stats));
  KJ_EXPECT(S_ISDIR(stats.st_mode));

  // Already there.
  makeDirectories(nested);

  auto file = kj::str(tmp, "/file");
  raiiOpen(file, O_WRONLY | O_CREAT | O_CLOEXEC);
  KJ_EXPECT_THROW_MESSAGE("not a directory", makeDirectories(file));

  KJ_SYSCALL(unlink(file.cStr()));
  KJ_SYSCALL(rmdir(nested.cStr()));
  KJ_SYSCALL(rmdir(kj::str(tmp, "/a/b").cStr()));
  KJ_SYSCALL(rmdir(kj::str(tmp, "/a").cStr()));
  KJ_SYSCALL(rmdir(tmp.cStr()));
}

KJ_TEST("setProcessName") {
  auto pipe = Pipe::make();

  pid_t child;
  KJ_SYSCALL(child = fork());
  if (child == 0) {
    KJ_DEFER(_exit(1));
    pipe.readEnd = nullptr;
    setProcessName("[sandbox-xyz]");
    auto comm = readAll("/proc/self/comm");
    // ps and friends show the command line, which holds NUL-separated arguments.
    auto cmdline = readAll("/proc/self/cmdline");
    auto report = kj::str(comm, kj::StringPtr(cmdline.cStr()), "\n");
    KJ_SYSCALL(write(pipe.writeEnd, report.begin(), report.size()));
    _exit(0);
  }
  pipe.writeEnd = nullptr;

  KJ_EXPECT(readAll(pipe.readEnd) == "[sandbox-xyz]\n[sandbox-xyz]\n");
  waitForStatus(child);
}

KJ_TEST("async-signal-safe logging") {
  KJ_EXPECT(captureStderr([]() { logSafely("hello\n"); }) == "hello\n");
  KJ_EXPECT(captureStderr([]() { logChildSafely("exited", 42, 137); })
      == "** SANDBOXER: child 42 exited (137)\n");
  KJ_EXPECT(captureStderr([]() { logChildSafely("exited", 7, 0); })
      == "** SANDBOXER: child 7 exited (0)\n");
  KJ_EXPECT(captureStderr([]() { logErrorSafely("waitpid()", 10); })
      == "** SANDBOXER: waitpid() failed (errno 10)\n");
}

}  // namespace
}  // namespace sandboxer
