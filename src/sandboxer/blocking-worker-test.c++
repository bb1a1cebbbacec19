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
#include <kj/test.h>
#include <kj/debug.h>
#include <kj/vector.h>
#include <sys/syscall.h>
#include <unistd.h>

namespace sandboxer {
namespace {

pid_t currentThreadId() {
  return syscall(SYS_gettid);
}

KJ_TEST("BlockingWorker runs work on its own thread") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  BlockingWorker worker;

  pid_t self = currentThreadId();
  pid_t worker1 = worker.run([]() { return currentThreadId(); }).wait(waitScope);
  pid_t worker2 = worker.run([]() { return currentThreadId(); }).wait(waitScope);

  KJ_EXPECT(worker1 != self);
  KJ_EXPECT(worker1 == worker2);
}

KJ_TEST("BlockingWorker runs work in submission order") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  BlockingWorker worker;

  kj::MutexGuarded<kj::Vector<uint>> order;
  kj::Vector<kj::Promise<void>> promises;
  for (uint i = 0; i < 10; i++) {
    promises.add(worker.run([&order, i]() {
      usleep(1000);
      order.lockExclusive()->add(i);
    }));
  }
  kj::joinPromises(promises.releaseAsArray()).wait(waitScope);

  auto lock = order.lockExclusive();
  KJ_ASSERT(lock->size() == 10);
  for (uint i = 0; i < 10; i++) {
    KJ_EXPECT((*lock)[i] == i);
  }
}

KJ_TEST("BlockingWorker propagates exceptions") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  BlockingWorker worker;

  KJ_EXPECT_THROW_MESSAGE("sandbox parent is gone", worker.run([]() -> int {
    KJ_FAIL_REQUIRE("sandbox parent is gone");
  }).wait(waitScope));

  // Still usable afterwards.
  KJ_EXPECT(worker.run([]() { return 5; }).wait(waitScope) == 5);
}

}  // namespace
}  // namespace sandboxer
