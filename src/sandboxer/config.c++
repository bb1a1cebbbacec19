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

#include "config.h"
#include "util.h"
#include <kj/debug.h>

namespace sandboxer {

kj::Maybe<kj::LogSeverity> parseLogLevel(kj::StringPtr name) {
  auto lower = kj::heapString(name);
  for (char& c: lower) {
    if ('A' <= c && c <= 'Z') {
      c = c - 'A' + 'a';
    }
  }

  if (lower == "debug" || lower == "trace" || lower == "info") {
    return kj::LogSeverity::INFO;
  } else if (lower == "warn" || lower == "warning") {
    return kj::LogSeverity::WARNING;
  } else if (lower == "error") {
    return kj::LogSeverity::ERROR;
  } else {
    return nullptr;
  }
}

Config parseConfig(kj::StringPtr text) {
  Config config;

  for (auto& line: splitLines(text)) {
    auto equalsPos = KJ_ASSERT_NONNULL(line.findFirst('='), "Invalid config line", line);
    auto key = trim(line.slice(0, equalsPos));
    auto value = trim(line.slice(equalsPos + 1));

    if (key == "LISTEN") {
      KJ_REQUIRE(value.size() > 0, "invalid config value LISTEN", value);
      config.listen = kj::mv(value);
    } else if (key == "DIR") {
      KJ_REQUIRE(value.size() > 0, "invalid config value DIR", value);
      config.dir = kj::mv(value);
    } else if (key == "LOG_LEVEL") {
      KJ_IF_MAYBE(level, parseLogLevel(value)) {
        config.logLevel = *level;
      } else {
        KJ_FAIL_REQUIRE("invalid config value LOG_LEVEL", value);
      }
    } else {
      KJ_LOG(WARNING, "Ignoring unrecognized config option", key);
    }
  }

  return config;
}

Config readConfig(kj::StringPtr path) {
  return parseConfig(readAll(path));
}

}  // namespace sandboxer
