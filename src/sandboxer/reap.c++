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
#include <sys/wait.h>
#include <errno.h>

namespace sandboxer {

ReapResult reapOne() {
  ReapResult result;
  for (;;) {
    int status;
    pid_t pid = waitpid(-1, &status, WNOHANG);
    if (pid < 0) {
      int error = errno;
      if (error == EINTR) continue;
      if (error == ECHILD) {
        result.init<ReapNoChildren>();
      } else {
        result.init<ReapError>(ReapError { error });
      }
    } else if (pid == 0) {
      result.init<ReapNoChildren>();
    } else if (WIFEXITED(status)) {
      result.init<ReapExited>(ReapExited { pid, WEXITSTATUS(status) });
    } else if (WIFSIGNALED(status)) {
      result.init<ReapSignaled>(ReapSignaled { pid, WTERMSIG(status) });
    } else {
      // Stopped or continued. We never ask for those, but skip them rather than stop reaping.
      continue;
    }
    return result;
  }
}

int reapAll(kj::FunctionParam<void(pid_t pid, int exitCode)> onReaped) {
  for (;;) {
    auto result = reapOne();
    if (result.is<ReapExited>()) {
      auto& exited = result.get<ReapExited>();
      onReaped(exited.pid, exited.status);
    } else if (result.is<ReapSignaled>()) {
      auto& signaled = result.get<ReapSignaled>();
      onReaped(signaled.pid, SIGNALED_EXIT_BASE + signaled.signal);
    } else if (result.is<ReapNoChildren>()) {
      return 0;
    } else {
      return result.get<ReapError>().error;
    }
  }
}

}  // namespace sandboxer
