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

#ifndef SANDBOXER_EXIT_NOTIFIER_H_
#define SANDBOXER_EXIT_NOTIFIER_H_

#include <kj/async.h>
#include <kj/async-unix.h>
#include <kj/vector.h>
#include <sys/types.h>
#include <signal.h>
#include <map>

namespace sandboxer {

class ExitMonitor {
  // Receives the exit code of every child reaped by the main program.

public:
  virtual ~ExitMonitor() noexcept(false) = default;

  virtual kj::Promise<void> notifyByPid(pid_t pid, int exitCode) = 0;
  // `exitCode` is the exit status, or 128 + signal number if the child was killed.
};

class ProcessMonitor final: public ExitMonitor {
  // Resumes whoever is waiting for a particular pid.

public:
  kj::Promise<int> subscribe(pid_t pid);
  // Resolves with the exit code of `pid` once it has been reaped. The pid must still be
  // running: exits nobody subscribed to beforehand are dropped.

  kj::Promise<void> notifyByPid(pid_t pid, int exitCode) override;

private:
  std::map<pid_t, kj::Vector<kj::Own<kj::PromiseFulfiller<int>>>> subscribers;
};

class ExitNotifier {
  // Handles the main program's signals on its event loop. SIGCHLD reaps children and reports
  // them to the monitor; SIGTERM and SIGINT request shutdown.
  //
  // kj::UnixEventPort::captureSignal() must have been called for each watched signal before
  // the event port was created.

public:
  ExitNotifier(kj::UnixEventPort& eventPort, ExitMonitor& monitor);

  kj::Promise<void> run(kj::ArrayPtr<const int> signals = DEFAULT_SIGNALS);
  // Watches `signals` forever. Never resolves; fails only if the event port does.

  kj::Promise<int> onShutdown();
  // Resolves with the first SIGTERM or SIGINT received. Nothing is torn down here; the caller
  // decides what shutting down means.

  kj::Maybe<int> getShutdownSignal() { return shutdownSignal; }

  kj::Promise<void> handleSignal(const siginfo_t& info);

  kj::Promise<void> reapChildren();
  // Reaps every child that has already terminated and reports each to the monitor, whether or
  // not a SIGCHLD was seen for it.

  static constexpr int DEFAULT_SIGNALS[] = { SIGCHLD, SIGTERM, SIGINT };

private:
  ExitNotifier(kj::UnixEventPort& eventPort, ExitMonitor& monitor,
               kj::PromiseFulfillerPair<int> shutdown);

  kj::UnixEventPort& eventPort;
  ExitMonitor& monitor;
  kj::Maybe<int> shutdownSignal;
  kj::ForkedPromise<int> shutdownPromise;
  kj::Own<kj::PromiseFulfiller<int>> shutdownFulfiller;

  kj::Promise<void> watch(int signo);
};

}  // namespace sandboxer

#endif // SANDBOXER_EXIT_NOTIFIER_H_
