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

#ifndef SANDBOXER_CONFIG_H_
#define SANDBOXER_CONFIG_H_

#include <kj/string.h>
#include <kj/exception.h>

namespace sandboxer {

struct Config {
  kj::String listen = kj::str("/run/kuasar-runc-sandboxer.sock");
  // Unix socket on which the SandboxController interface is served.

  kj::String dir = kj::str("/run/kuasar-runc");
  // Created at startup if missing. The sandboxer itself writes nothing there.

  kj::LogSeverity logLevel = kj::LogSeverity::INFO;
};

kj::Maybe<kj::LogSeverity> parseLogLevel(kj::StringPtr name);
// Accepts "debug", "info", "warn", "warning" and "error", in any case. KJ has no level below
// INFO, so "debug" means INFO.

Config parseConfig(kj::StringPtr text);
// Parses KEY=VALUE lines (LISTEN, DIR, LOG_LEVEL) on top of the defaults. Blank lines and
// #-comments are ignored; unknown keys are logged and ignored.

Config readConfig(kj::StringPtr path);
// Read and parse the config file at `path`.

}  // namespace sandboxer

#endif // SANDBOXER_CONFIG_H_
