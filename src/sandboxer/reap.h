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

#ifndef SANDBOXER_REAP_H_
#define SANDBOXER_REAP_H_
// Collecting terminated children without blocking.
//
// Everything here is async-signal-safe: no allocation, no locks, no exceptions, and nothing
// but waitpid(). The sandbox parent calls reapAll() directly from its SIGCHLD handler.

#include <kj/function.h>
#include <kj/one-of.h>
#include <sys/types.h>

namespace sandboxer {

constexpr int SIGNALED_EXIT_BASE = 128;
// A child killed by signal N is reported with exit code 128 + N, as shells do.

struct ReapExited {
  pid_t pid;
  int status;
};

struct ReapSignaled {
  pid_t pid;
  int signal;
};

struct ReapNoChildren {};
// There are no children, or none of them has changed state.

struct ReapError {
  int error;
};

typedef kj::OneOf<ReapExited, ReapSignaled, ReapNoChildren, ReapError> ReapResult;

ReapResult reapOne();
// One non-blocking waitpid(-1). EINTR is retried.

int reapAll(kj::FunctionParam<void(pid_t pid, int exitCode)> onReaped);
// Reap every child that has terminated, calling `onReaped` for each one. Returns 0 once no
// more children are pending, or the errno of an unexpected waitpid() failure. Such a failure
// only ends this pass; the caller logs it and the next SIGCHLD starts a new pass.

}  // namespace sandboxer

#endif // SANDBOXER_REAP_H_
