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

#ifndef SANDBOXER_SANDBOX_FACTORY_H_
#define SANDBOXER_SANDBOX_FACTORY_H_

#include <kj/array.h>
#include <kj/string.h>
#include <stdint.h>
#include "util.h"

namespace sandboxer {

class PidHandoff {
  // A single-use pipe that carries one 32-bit value (a pid, or a negative errno) from a forked
  // descendant back to the process that forked it. Each stage of sandbox creation gets its own
  // handoff, created just before the fork that it reports on, so exactly one process ever holds
  // each end.

public:
  static PidHandoff make();

  void send(int32_t value);
  // Called by the child. Closes the write end afterwards.

  int32_t receive();
  // Called by the parent. Blocks until the value arrives. Throws DISCONNECTED if every writer
  // exited without sending.

  void closeReadEnd() { pipe.readEnd = nullptr; }
  void closeWriteEnd() { pipe.writeEnd = nullptr; }

private:
  explicit PidHandoff(Pipe pipe): pipe(kj::mv(pipe)) {}

  Pipe pipe;
};

class SandboxFactory {
  // Creates sandbox leaders: processes that are pid 1 of a fresh PID namespace, alone in fresh
  // IPC and UTS namespaces, optionally inside an existing network namespace, and that do nothing
  // but pause() until they are killed.
  //
  // The caller must be prepared to reap children it did not wait for: the intermediate
  // "launcher" process exits as soon as the leader is running, and the leader itself is
  // reparented to the nearest subreaper (normally the caller) once the launcher is gone.

public:
  explicit SandboxFactory(kj::Array<int> inheritedFds = nullptr);
  // `inheritedFds` are descriptors of the calling process that its forked children must close
  // before doing anything else, so that no sandbox leader keeps the caller's channels open.

  KJ_DISALLOW_COPY(SandboxFactory);

  int32_t create(kj::StringPtr sandboxId, kj::StringPtr netnsPath);
  // Returns the leader's pid as seen from the caller's PID namespace, or -errno if the sandbox
  // could not be created. `netnsPath` may be empty.

private:
  kj::Array<int> inheritedFds;

  void runLauncher(PidHandoff& handoff, kj::StringPtr sandboxId, kj::StringPtr netnsPath)
      KJ_NORETURN;
};

}  // namespace sandboxer

#endif // SANDBOXER_SANDBOX_FACTORY_H_
