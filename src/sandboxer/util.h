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

#ifndef SANDBOXER_UTIL_H_
#define SANDBOXER_UTIL_H_
// Small helpers shared by the sandboxer: pipes, file descriptors, text handling, process naming
// and logging from contexts where KJ_LOG is not allowed.

#include <kj/io.h>
#include <kj/string.h>
#include <kj/debug.h>
#include <sys/types.h>
#include <fcntl.h>
#include <unistd.h>

namespace sandboxer {

typedef unsigned int uint;
typedef unsigned char byte;

#define KJ_MVCAP(var) var = ::kj::mv(var)
// Capture the given variable by move.  Place this in a lambda capture list.

struct Pipe {
  kj::AutoCloseFd readEnd;
  kj::AutoCloseFd writeEnd;

  static Pipe make();
  // Both ends are close-on-exec.
};

kj::AutoCloseFd raiiOpen(kj::StringPtr name, int flags, mode_t mode = 0666);

kj::String readAll(int fd);
kj::String readAll(kj::StringPtr name);
// Read entire contents of the file descriptor / named file to a String.

kj::String trim(kj::ArrayPtr<const char> slice);
kj::ArrayPtr<const char> trimArray(kj::ArrayPtr<const char> slice);
// Remove whitespace from both ends of the char array.

kj::Array<kj::String> splitLines(kj::StringPtr input);
// Split the input into lines, trimming whitespace, and ignoring blank lines or lines that start
// with #.

void makeDirectories(kj::StringPtr path);
// Like `mkdir -p`.

void setProcessName(kj::StringPtr name);
// Rewrite the name this process shows in process listings, both the short name ("top",
// /proc/<pid>/comm, truncated to 15 bytes by the kernel) and the command line ("ps").
//
// The command line is pointed at a private buffer with PR_SET_MM when we have CAP_SYS_RESOURCE.
// Otherwise the original argv block is overwritten, which truncates the name to the length of
// the arguments the process was started with.

void logSafely(const char* text);
// Log a message in an async-signal-safe way.

void logChildSafely(const char* event, pid_t pid, int value);
// Writes "** SANDBOXER: child <pid> <event> (<value>)" to stderr. Async-signal-safe.

void logErrorSafely(const char* what, int error);
// Writes "** SANDBOXER: <what> failed (errno <error>)" to stderr. Async-signal-safe.

}  // namespace sandboxer

#endif // SANDBOXER_UTIL_H_
