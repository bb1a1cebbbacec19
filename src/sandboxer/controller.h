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

#ifndef SANDBOXER_CONTROLLER_H_
#define SANDBOXER_CONTROLLER_H_

#include <sandboxer/sandboxer.capnp.h>
#include <kj/async.h>
#include <map>
#include "sandbox-parent.h"
#include "blocking-worker.h"

namespace sandboxer {

class SandboxControllerImpl final: public SandboxController::Server,
                                   private kj::TaskSet::ErrorHandler {
  // Each leader created here is held by a pidfd until it is stopped or found to have exited, so
  // a stop() never signals an unrelated process that inherited a dead leader's pid.

public:
  SandboxControllerImpl(const SandboxParent& parent, BlockingWorker& worker)
      : parent(parent), worker(worker), tasks(*this) {}

  kj::Promise<void> create(CreateContext context) override;
  kj::Promise<void> stop(StopContext context) override;

  bool manages(pid_t pid) const { return sandboxes.count(pid) > 0; }

private:
  const SandboxParent& parent;
  BlockingWorker& worker;
  std::map<pid_t, kj::AutoCloseFd> sandboxes;
  kj::TaskSet tasks;

  void track(pid_t pid);
  void forgetExited();

  void taskFailed(kj::Exception&& exception) override;
};

}  // namespace sandboxer

#endif // SANDBOXER_CONTROLLER_H_
