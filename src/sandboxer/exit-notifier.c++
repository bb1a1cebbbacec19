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

#include "exit-notifier.h"
#include "reap.h"
#include <kj/debug.h>
#include <string.h>

namespace sandboxer {

kj::Promise<int> ProcessMonitor::subscribe(pid_t pid) {
  auto paf = kj::newPromiseAndFulfiller<int>();
  subscribers[pid].add(kj::mv(paf.fulfiller));
  return kj::mv(paf.promise);
}

kj::Promise<void> ProcessMonitor::notifyByPid(pid_t pid, int exitCode) {
  auto iter = subscribers.find(pid);
  if (iter == subscribers.end()) {
    KJ_LOG(INFO, "nobody is waiting for this process", pid, exitCode);
    return kj::READY_NOW;
  }

  auto waiting = kj::mv(iter->second);
  subscribers.erase(iter);
  for (auto& fulfiller: waiting) {
    fulfiller->fulfill(kj::cp(exitCode));
  }
  return kj::READY_NOW;
}

// =======================================================================================

ExitNotifier::ExitNotifier(kj::UnixEventPort& eventPort, ExitMonitor& monitor)
    : ExitNotifier(eventPort, monitor, kj::newPromiseAndFulfiller<int>()) {}

ExitNotifier::ExitNotifier(kj::UnixEventPort& eventPort, ExitMonitor& monitor,
                           kj::PromiseFulfillerPair<int> shutdown)
    : eventPort(eventPort), monitor(monitor),
      shutdownPromise(shutdown.promise.fork()),
      shutdownFulfiller(kj::mv(shutdown.fulfiller)) {}

kj::Promise<void> ExitNotifier::run(kj::ArrayPtr<const int> signals) {
  auto watchers = KJ_MAP(signo, signals) {
    return watch(signo);
  };
  return kj::joinPromises(kj::mv(watchers));
}

kj::Promise<int> ExitNotifier::onShutdown() {
  return shutdownPromise.addBranch();
}

kj::Promise<void> ExitNotifier::watch(int signo) {
  return eventPort.onSignal(signo).then([this](siginfo_t&& info) {
    return handleSignal(info);
  }).then([this, signo]() {
    return watch(signo);
  });
}

kj::Promise<void> ExitNotifier::handleSignal(const siginfo_t& info) {
  switch (info.si_signo) {
    case SIGCHLD:
      return reapChildren();

    case SIGTERM:
    case SIGINT:
      KJ_LOG(INFO, "received shutdown signal", strsignal(info.si_signo));
      if (shutdownSignal == nullptr) {
        shutdownSignal = info.si_signo;
        shutdownFulfiller->fulfill(kj::cp(info.si_signo));
      }
      return kj::READY_NOW;

    default:
      KJ_LOG(WARNING, "ignoring unexpected signal", info.si_signo);
      return kj::READY_NOW;
  }
}

kj::Promise<void> ExitNotifier::reapChildren() {
  struct Reaped {
    pid_t pid;
    int exitCode;
  };

  kj::Vector<Reaped> reaped;
  int error = reapAll([&](pid_t pid, int exitCode) {
    reaped.add(Reaped { pid, exitCode });
  });
  if (error != 0) {
    KJ_LOG(WARNING, "waitpid() failed while reaping children", strerror(error));
  }

  auto notifications = KJ_MAP(child, reaped) {
    KJ_LOG(INFO, "child exited", child.pid, child.exitCode);
    pid_t pid = child.pid;
    return kj::evalNow([&]() {
      return monitor.notifyByPid(child.pid, child.exitCode);
    }).catch_([pid](kj::Exception&& exception) {
      KJ_LOG(ERROR, "failed to send exit event", pid, exception);
    });
  };
  return kj::joinPromises(kj::mv(notifications));
}

}  // namespace sandboxer
