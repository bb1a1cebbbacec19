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

#ifndef SANDBOXER_BLOCKING_WORKER_H_
#define SANDBOXER_BLOCKING_WORKER_H_

#include <kj/async.h>
#include <kj/mutex.h>
#include <kj/thread.h>

namespace sandboxer {

class BlockingWorker {
  // A thread with its own event loop for calls that block, such as asking the sandbox parent
  // for a new sandbox, so that they don't stall the main event loop. Work runs one item at a
  // time in submission order.
  //
  // Create it after signals have been captured with kj::UnixEventPort::captureSignal() so the
  // thread inherits the blocked signal mask.

public:
  BlockingWorker();
  ~BlockingWorker() noexcept(false);
  KJ_DISALLOW_COPY(BlockingWorker);

  template <typename Func>
  kj::PromiseForResult<Func, void> run(Func&& func) {
    // Runs `func` on the worker thread. The returned promise belongs to the calling thread's
    // event loop. Exceptions thrown by `func` reject it.
    return executor->executeAsync(kj::fwd<Func>(func));
  }

private:
  struct State {
    kj::Maybe<const kj::Executor&> executor;
    kj::Own<kj::PromiseFulfiller<void>> stop;
  };

  kj::MutexGuarded<State> state;
  const kj::Executor* executor = nullptr;
  kj::Thread thread;

  void threadMain();
};

}  // namespace sandboxer

#endif // SANDBOXER_BLOCKING_WORKER_H_
