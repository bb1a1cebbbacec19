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

#include "blocking-worker.h"
#include <kj/debug.h>

namespace sandboxer {

BlockingWorker::BlockingWorker()
    : thread([this]() { threadMain(); }) {
  executor = state.when([](const State& s) { return s.executor != nullptr; },
                        [](State& s) { return &KJ_ASSERT_NONNULL(s.executor); });
}

BlockingWorker::~BlockingWorker() noexcept(false) {
  executor->executeSync([this]() {
    auto lock = state.lockExclusive();
    lock->stop->fulfill();
  });
  // ~Thread() joins.
}

void BlockingWorker::threadMain() {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);

  auto stopped = kj::newPromiseAndFulfiller<void>();
  {
    auto lock = state.lockExclusive();
    lock->stop = kj::mv(stopped.fulfiller);
    lock->executor = kj::getCurrentThreadExecutor();
  }

  stopped.promise.wait(waitScope);

  // The fulfiller belongs to this thread's event loop.
  state.lockExclusive()->stop = nullptr;
}

}  // namespace sandboxer
