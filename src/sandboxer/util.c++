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

#include "util.h"
#include <kj/vector.h>
#include <errno.h>
#include <ctype.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/prctl.h>

namespace sandboxer {

Pipe Pipe::make() {
  int fds[2];
  KJ_SYSCALL(pipe2(fds, O_CLOEXEC));
  return { kj::AutoCloseFd(fds[0]), kj::AutoCloseFd(fds[1]) };
}

kj::AutoCloseFd raiiOpen(kj::StringPtr name, int flags, mode_t mode) {
  int fd;
  KJ_SYSCALL(fd = open(name.cStr(), flags, mode), name);
  return kj::AutoCloseFd(fd);
}

kj::String readAll(int fd) {
  kj::FdInputStream input(fd);
  kj::Vector<char> content;
  for (;;) {
    char buffer[4096];
    size_t n = input.tryRead(buffer, sizeof(buffer), sizeof(buffer));
    content.addAll(buffer, buffer + n);
    if (n < sizeof(buffer)) {
      // Done!
      break;
    }
  }
  content.add('\0');
  return kj::String(content.releaseAsArray());
}

kj::String readAll(kj::StringPtr name) {
  return readAll(raiiOpen(name, O_RDONLY | O_CLOEXEC));
}

kj::ArrayPtr<const char> trimArray(kj::ArrayPtr<const char> slice) {
  while (slice.size() > 0 && isspace(slice[0])) {
    slice = slice.slice(1, slice.size());
  }
  while (slice.size() > 0 && isspace(slice[slice.size() - 1])) {
    slice = slice.slice(0, slice.size() - 1);
  }

  return slice;
}

kj::String trim(kj::ArrayPtr<const char> slice) {
  return kj::heapString(trimArray(slice));
}

kj::Array<kj::String> splitLines(kj::StringPtr input) {
  size_t lineStart = 0;
  kj::Vector<kj::String> results;
  for (size_t i = 0; i < input.size(); i++) {
    if (input[i] == '\n' || input[i] == '#') {
      bool hasComment = input[i] == '#';
      auto line = trim(input.slice(lineStart, i));
      if (line.size() > 0) {
        results.add(kj::mv(line));
      }
      if (hasComment) {
        // Ignore through newline.
        ++i;
        while (i < input.size() && input[i] != '\n') ++i;
      }
      lineStart = i + 1;
    }
  }

  if (lineStart < input.size()) {
    auto lastLine = trim(input.slice(lineStart));
    if (lastLine.size() > 0) {
      results.add(kj::mv(lastLine));
    }
  }

  return results.releaseAsArray();
}

void makeDirectories(kj::StringPtr path) {
  bool firstTry = true;
  while (mkdir(path.cStr(), 0755) < 0) {
    int error = errno;
    if (firstTry && error == ENOENT) {
      KJ_IF_MAYBE(pos, path.findLast('/')) {
        if (*pos > 0) {
          makeDirectories(kj::heapString(path.slice(0, *pos)));
        }
      }
      firstTry = false;
    } else if (error == EEXIST) {
      struct stat stats;
      KJ_SYSCALL(stat(path.cStr(), &stats), path);
      KJ_REQUIRE(S_ISDIR(stats.st_mode), "not a directory", path);
      break;
    } else if (error != EINTR) {
      KJ_FAIL_SYSCALL("mkdir(path)", error, path);
    }
  }
}

// =======================================================================================
// Process name setting.

namespace {

// HACK: We grab the global argv pointer at startup so that we can overwrite it to set the
//   process name when PR_SET_MM is not permitted.
kj::ArrayPtr<char> globalArgv;
__attribute__((constructor)) void captureArgv(int argc, char **argv) {
  if (argc > 0 && argv != nullptr) {
    globalArgv = kj::arrayPtr(argv[0], argv[argc - 1] + strlen(argv[argc - 1]));
  }
}

// Backing store for the command line once PR_SET_MM has pointed the kernel at it. Each process
// gets its own copy across fork().
char processNameBuffer[128];

bool setArgvRange(unsigned long start, unsigned long end) {
  // The kernel rejects a range where start > end at any point, so the order of the two updates
  // depends on where the new range lies relative to the old one.
  if (prctl(PR_SET_MM, PR_SET_MM_ARG_START, start, 0, 0) == 0) {
    return prctl(PR_SET_MM, PR_SET_MM_ARG_END, end, 0, 0) == 0;
  }
  return prctl(PR_SET_MM, PR_SET_MM_ARG_END, end, 0, 0) == 0 &&
         prctl(PR_SET_MM, PR_SET_MM_ARG_START, start, 0, 0) == 0;
}

}  // namespace

void setProcessName(kj::StringPtr name) {
  KJ_SYSCALL(prctl(PR_SET_NAME, name.cStr(), 0, 0, 0), name);

  size_t size = kj::min(name.size(), sizeof(processNameBuffer) - 1);
  memcpy(processNameBuffer, name.begin(), size);
  processNameBuffer[size] = '\0';
  auto start = reinterpret_cast<unsigned long>(processNameBuffer);
  if (setArgvRange(start, start + size + 1)) {
    return;
  }

  if (globalArgv.size() > 0) {
    size_t n = kj::min(name.size(), globalArgv.size());
    memcpy(globalArgv.begin(), name.begin(), n);
    memset(globalArgv.begin() + n, 0, globalArgv.size() - n);
  }
}

// =======================================================================================
// Signal-safe logging.

void logSafely(const char* text) {
  while (text[0] != '\0') {
    ssize_t n = write(STDERR_FILENO, text, strlen(text));
    if (n < 0) {
      if (errno == EINTR) continue;
      return;
    }
    text += n;
  }
}

static char* appendSafely(char* pos, char* end, const char* text) {
  while (*text != '\0' && pos < end) *pos++ = *text++;
  return pos;
}

static char* appendIntSafely(char* pos, char* end, long value) {
  char digits[24];
  char* d = digits + sizeof(digits);
  *--d = '\0';
  bool negative = value < 0;
  unsigned long magnitude = negative ? -static_cast<unsigned long>(value) : value;
  do {
    *--d = '0' + magnitude % 10;
    magnitude /= 10;
  } while (magnitude != 0);
  if (negative) *--d = '-';
  return appendSafely(pos, end, d);
}

void logChildSafely(const char* event, pid_t pid, int value) {
  char line[256];
  char* end = line + sizeof(line) - 2;
  char* pos = appendSafely(line, end, "** SANDBOXER: child ");
  pos = appendIntSafely(pos, end, pid);
  pos = appendSafely(pos, end, " ");
  pos = appendSafely(pos, end, event);
  pos = appendSafely(pos, end, " (");
  pos = appendIntSafely(pos, end, value);
  pos = appendSafely(pos, end, ")\n");
  *pos = '\0';
  logSafely(line);
}

void logErrorSafely(const char* what, int error) {
  char line[256];
  char* end = line + sizeof(line) - 2;
  char* pos = appendSafely(line, end, "** SANDBOXER: ");
  pos = appendSafely(pos, end, what);
  pos = appendSafely(pos, end, " failed (errno ");
  pos = appendIntSafely(pos, end, error);
  pos = appendSafely(pos, end, ")\n");
  *pos = '\0';
  logSafely(line);
}

}  // namespace sandboxer
