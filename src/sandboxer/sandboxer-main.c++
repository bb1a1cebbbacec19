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

#include <kj/main.h>
#include <kj/debug.h>
#include <kj/async-io.h>
#include <kj/async-unix.h>
#include <capnp/rpc-twoparty.h>
#include <unistd.h>
#include <signal.h>
#include <string.h>

#include <sandboxer/version.h>
#include "config.h"
#include "controller.h"
#include "exit-notifier.h"
#include "sandbox-parent.h"
#include "blocking-worker.h"

namespace sandboxer {

class SandboxerMain {
  // Main class for the runc sandboxer. Forks the sandbox parent first thing, then serves the
  // SandboxController interface until told to stop.

public:
  SandboxerMain(kj::ProcessContext& context): context(context) {}

  kj::MainFunc getMain() {
    return kj::MainBuilder(context, "runc-sandboxer version " SANDBOXER_VERSION,
                           "Creates namespace-isolated sandbox leader processes for runc "
                           "sandboxes. A dedicated subreaper process (\"[sandbox-parent]\") "
                           "forks every leader; this process serves requests for them on a "
                           "unix socket.")
        .addOptionWithArg({'c', "config"}, KJ_BIND_METHOD(*this, setConfigFile), "<path>",
                          "Read settings from the config file at <path>. Options given on the "
                          "command line take precedence.")
        .addOptionWithArg({'l', "listen"}, KJ_BIND_METHOD(*this, setListen), "<path>",
                          "Serve the sandbox controller on the unix socket at <path>.")
        .addOptionWithArg({'d', "dir"}, KJ_BIND_METHOD(*this, setDir), "<path>",
                          "Create <path> at startup if it does not exist.")
        .addOptionWithArg({"log-level"}, KJ_BIND_METHOD(*this, setLogLevel), "<level>",
                          "One of debug, info, warn, error. Default is info.")
        .callAfterParsing(KJ_BIND_METHOD(*this, run))
        .build();
  }

private:
  kj::ProcessContext& context;
  kj::Maybe<kj::String> configFile;
  kj::Maybe<kj::String> listen;
  kj::Maybe<kj::String> dir;
  kj::Maybe<kj::LogSeverity> logLevel;

  kj::MainBuilder::Validity setConfigFile(kj::StringPtr path) {
    configFile = kj::heapString(path);
    return true;
  }

  kj::MainBuilder::Validity setListen(kj::StringPtr path) {
    if (path.size() == 0) {
      return "Invalid listen path.";
    }
    listen = kj::heapString(path);
    return true;
  }

  kj::MainBuilder::Validity setDir(kj::StringPtr path) {
    if (path.size() == 0) {
      return "Invalid directory.";
    }
    dir = kj::heapString(path);
    return true;
  }

  kj::MainBuilder::Validity setLogLevel(kj::StringPtr name) {
    KJ_IF_MAYBE(level, parseLogLevel(name)) {
      logLevel = *level;
      return true;
    } else {
      return "Unknown log level.";
    }
  }

  Config loadConfig() {
    Config config;
    KJ_IF_MAYBE(path, configFile) {
      config = readConfig(*path);
    }
    KJ_IF_MAYBE(l, listen) {
      config.listen = kj::mv(*l);
    }
    KJ_IF_MAYBE(d, dir) {
      config.dir = kj::mv(*d);
    }
    KJ_IF_MAYBE(level, logLevel) {
      config.logLevel = *level;
    }
    return config;
  }

  kj::MainBuilder::Validity run() {
    auto config = loadConfig();
    kj::_::Debug::setLogLevel(config.logLevel);
    makeDirectories(config.dir);

    // Must happen before any thread exists and before SIGCHLD is captured below: the sandbox
    // parent needs a plain single-threaded process with SIGCHLD deliverable.
    auto sandboxParent = forkSandboxParent();

    for (int signo: ExitNotifier::DEFAULT_SIGNALS) {
      kj::UnixEventPort::captureSignal(signo);
    }
    auto ioContext = kj::setupAsyncIo();
    BlockingWorker worker;

    ProcessMonitor monitor;
    ExitNotifier notifier(ioContext.unixEventPort, monitor);

    // A child that exited before SIGCHLD was captured raised no signal we will ever see, so
    // reap once after everything below has subscribed, then follow signals.
    auto signals = kj::evalLater([&notifier]() {
      return notifier.reapChildren();
    }).then([&notifier]() {
      return notifier.run();
    }).then([]() -> kj::Maybe<kj::String> {
      return kj::str("signal handling stopped");
    }, [](kj::Exception&& exception) -> kj::Maybe<kj::String> {
      return kj::str("signal handling failed: ", exception);
    });

    auto shutdown = notifier.onShutdown().then([](int signo) -> kj::Maybe<kj::String> {
      KJ_LOG(INFO, "shutting down", strsignal(signo));
      return nullptr;
    });

    // Without the sandbox parent no sandbox can be created; pending requests have already
    // failed with a closed channel.
    auto parentExited = monitor.subscribe(sandboxParent->getPid())
        .then([](int exitCode) -> kj::Maybe<kj::String> {
      return kj::str("sandbox parent exited unexpectedly (", exitCode, ")");
    });

    unlink(config.listen.cStr());  // Clear stale socket, if any.
    auto address = ioContext.provider->getNetwork()
        .parseAddress(kj::str("unix:", config.listen)).wait(ioContext.waitScope);
    auto listener = address->listen();
    capnp::TwoPartyServer server(kj::heap<SandboxControllerImpl>(*sandboxParent, worker));
    KJ_LOG(INFO, "runc-sandboxer listening", config.listen, config.dir);

    auto serving = server.listen(*listener).then([]() -> kj::Maybe<kj::String> {
      return kj::str("listener closed");
    });

    auto outcome = shutdown
        .exclusiveJoin(kj::mv(parentExited))
        .exclusiveJoin(kj::mv(serving))
        .exclusiveJoin(kj::mv(signals))
        .wait(ioContext.waitScope);

    unlink(config.listen.cStr());

    KJ_IF_MAYBE(error, outcome) {
      context.exitError(*error);
    }
    context.exit();
  }
};

}  // namespace sandboxer

KJ_MAIN(sandboxer::SandboxerMain)
