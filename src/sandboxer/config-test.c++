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
#include <kj/test.h>
#include <kj/debug.h>
#include <stdlib.h>
#include <string.h>
#include "util.h"

namespace sandboxer {
namespace {

KJ_TEST("config defaults") {
  auto config = parseConfig("");
  KJ_EXPECT(config.listen == "/run/kuasar-runc-sandboxer.sock");
  KJ_EXPECT(config.dir == "/run/kuasar-runc");
  KJ_EXPECT(config.logLevel == kj::LogSeverity::INFO);
}

KJ_TEST("config file") {
  auto config = parseConfig(
      "# runc sandboxer\n"
      "LISTEN=/tmp/sandboxer.sock\n"
      "\n"
      "  DIR = /tmp/sandboxer  \n"
      "LOG_LEVEL=Warn\n");
  KJ_EXPECT(config.listen == "/tmp/sandboxer.sock");
  KJ_EXPECT(config.dir == "/tmp/sandboxer");
  KJ_EXPECT(config.logLevel == kj::LogSeverity::WARNING);
}

KJ_TEST("config ignores unknown keys") {
  KJ_EXPECT_LOG(WARNING, "Ignoring unrecognized config option");
  auto config = parseConfig("WORKERS=4\nDIR=/tmp/x\n");
  KJ_EXPECT(config.dir == "/tmp/x");
}

KJ_TEST("config errors") {
  KJ_EXPECT_THROW_MESSAGE("Invalid config line", parseConfig("LISTEN /tmp/x.sock\n"));
  KJ_EXPECT_THROW_MESSAGE("invalid config value LISTEN", parseConfig("LISTEN=\n"));
  KJ_EXPECT_THROW_MESSAGE("invalid config value DIR", parseConfig("DIR=  \n"));
  KJ_EXPECT_THROW_MESSAGE("invalid config value LOG_LEVEL", parseConfig("LOG_LEVEL=loud\n"));
}

kj::LogSeverity levelOf(kj::StringPtr name) {
  auto level = parseLogLevel(name);
  return KJ_ASSERT_NONNULL(level, name);
}

KJ_TEST("log levels") {
  KJ_EXPECT(levelOf("debug") == kj::LogSeverity::INFO);
  KJ_EXPECT(levelOf("INFO") == kj::LogSeverity::INFO);
  KJ_EXPECT(levelOf("warning") == kj::LogSeverity::WARNING);
  KJ_EXPECT(levelOf("Error") == kj::LogSeverity::ERROR);
  KJ_EXPECT(parseLogLevel("fatal") == nullptr);
  KJ_EXPECT(parseLogLevel("") == nullptr);
}

KJ_TEST("readConfig") {
  char path[] = "/tmp/sandboxer-config.XXXXXX";
  int fd;
  KJ_SYSCALL(fd = mkstemp(path));
  kj::AutoCloseFd file(fd);
  kj::StringPtr text = "LISTEN=/tmp/from-file.sock\n";
  KJ_SYSCALL(write(file, text.begin(), text.size()));
  KJ_DEFER(unlink(path));

  auto config = readConfig(path);
  KJ_EXPECT(config.listen == "/tmp/from-file.sock");
  KJ_EXPECT(config.dir == "/run/kuasar-runc");

  KJ_EXPECT_THROW_MESSAGE("/tmp/sandboxer-config-missing",
      readConfig("/tmp/sandboxer-config-missing"));
}

}  // namespace
}  // namespace sandboxer
