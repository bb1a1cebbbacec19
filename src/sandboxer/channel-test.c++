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

#include "channel.h"
#include <kj/test.h>
#include <signal.h>
#include <sys/time.h>
#include <sys/wait.h>
#include <unistd.h>
#include <string.h>
#include "test-util.h"

namespace sandboxer {
namespace {

kj::String repeat(char c, size_t n) {
  auto result = kj::heapString(n);
  memset(result.begin(), c, n);
  return result;
}

KJ_TEST("fork request frame layout") {
  auto frame = encodeForkRequest("abc", "/var/run/netns/cni-1");

  KJ_EXPECT(frame.size() == REQUEST_FRAME_SIZE);
  KJ_EXPECT(memcmp(frame.begin(), "abc", 3) == 0);
  for (size_t i = 3; i < SANDBOX_ID_SIZE; i++) {
    KJ_EXPECT(frame[i] == 0, i);
  }
  KJ_EXPECT(memcmp(frame.begin() + SANDBOX_ID_SIZE, "/var/run/netns/cni-1", 20) == 0);
  KJ_EXPECT(frame[SANDBOX_ID_SIZE + 20] == 0);

  auto request = decodeForkRequest(frame);
  KJ_EXPECT(request.sandboxId == "abc");
  KJ_EXPECT(request.netnsPath == "/var/run/netns/cni-1");
}

KJ_TEST("fork request with no network namespace") {
  auto frame = encodeForkRequest("abc", "");
  KJ_EXPECT(frame[SANDBOX_ID_SIZE] == 0);

  auto request = decodeForkRequest(frame);
  KJ_EXPECT(request.sandboxId == "abc");
  KJ_EXPECT(request.netnsPath == "");
}

KJ_TEST("fork request with an empty id") {
  auto frame = encodeForkRequest("", "/proc/1/ns/net");
  for (size_t i = 0; i < SANDBOX_ID_SIZE; i++) {
    KJ_EXPECT(frame[i] == 0, i);
  }

  auto request = decodeForkRequest(frame);
  KJ_EXPECT(request.sandboxId == "");
  KJ_EXPECT(request.netnsPath == "/proc/1/ns/net");

  auto bare = decodeForkRequest(encodeForkRequest("", ""));
  KJ_EXPECT(bare.sandboxId == "");
  KJ_EXPECT(bare.netnsPath == "");
}

KJ_TEST("fork request id may fill its field") {
  auto id = repeat('a', SANDBOX_ID_SIZE);
  auto path = repeat('p', MAX_NETNS_PATH_SIZE);
  auto frame = encodeForkRequest(id, path);

  KJ_EXPECT(frame[SANDBOX_ID_SIZE - 1] == 'a');
  KJ_EXPECT(frame[REQUEST_FRAME_SIZE - 1] == 0);

  auto request = decodeForkRequest(frame);
  KJ_EXPECT(request.sandboxId == id);
  KJ_EXPECT(request.netnsPath == path);
}

KJ_TEST("invalid fork requests are rejected") {
  KJ_EXPECT_THROW_MESSAGE("sandbox id too long",
      encodeForkRequest(repeat('a', SANDBOX_ID_SIZE + 1), ""));
  KJ_EXPECT_THROW_MESSAGE("netns path too long",
      encodeForkRequest("abc", repeat('p', MAX_NETNS_PATH_SIZE + 1)));
  KJ_EXPECT_THROW_MESSAGE("sandbox id contains NUL",
      encodeForkRequest(kj::StringPtr("a\0b", 3), ""));
  KJ_EXPECT_THROW_MESSAGE("netns path contains NUL",
      encodeForkRequest("abc", kj::StringPtr("/a\0b", 4)));
}

KJ_TEST("decoding requires a terminated path") {
  kj::FixedArray<byte, REQUEST_FRAME_SIZE> frame;
  memset(frame.begin(), 'x', frame.size());
  KJ_EXPECT_THROW_MESSAGE("not NUL-terminated", decodeForkRequest(frame));

  KJ_EXPECT_THROW_MESSAGE("bad request frame size",
      decodeForkRequest(kj::arrayPtr(frame.begin(), 100)));
}

KJ_TEST("response frame encoding") {
  auto frame = encodePid(0x01020304);
  KJ_EXPECT(frame[0] == 0x04);
  KJ_EXPECT(frame[1] == 0x03);
  KJ_EXPECT(frame[2] == 0x02);
  KJ_EXPECT(frame[3] == 0x01);
  KJ_EXPECT(decodePid(frame) == 0x01020304);

  auto error = encodePid(-EPERM);
  KJ_EXPECT(error[0] == 0xff);
  KJ_EXPECT(error[3] == 0xff);
  KJ_EXPECT(decodePid(error) == -EPERM);
}

KJ_TEST("readExact reassembles fragments") {
  auto pipe = Pipe::make();
  auto frame = encodeForkRequest("fragmented", "/proc/1/ns/net");

  pid_t child;
  KJ_SYSCALL(child = fork());
  if (child == 0) {
    KJ_DEFER(_exit(1));
    pipe.readEnd = nullptr;
    for (size_t i = 0; i < frame.size(); i += 7) {
      size_t n = kj::min(frame.size() - i, size_t(7));
      writeExact(pipe.writeEnd, kj::arrayPtr(frame.begin() + i, n));
      usleep(100);
    }
    _exit(0);
  }
  pipe.writeEnd = nullptr;

  kj::FixedArray<byte, REQUEST_FRAME_SIZE> received;
  readExact(pipe.readEnd, received);
  KJ_EXPECT(memcmp(received.begin(), frame.begin(), frame.size()) == 0);

  int status = waitForStatus(child);
  KJ_EXPECT(WIFEXITED(status) && WEXITSTATUS(status) == 0);
}

KJ_TEST("writeExact writes more than a pipe holds") {
  auto pipe = Pipe::make();
  auto data = kj::heapArray<byte>(256 * 1024);
  for (size_t i = 0; i < data.size(); i++) {
    data[i] = i % 251;
  }

  pid_t child;
  KJ_SYSCALL(child = fork());
  if (child == 0) {
    KJ_DEFER(_exit(1));
    pipe.writeEnd = nullptr;
    auto received = kj::heapArray<byte>(data.size());
    readExact(pipe.readEnd, received);
    _exit(memcmp(received.begin(), data.begin(), data.size()) == 0 ? 0 : 2);
  }
  pipe.readEnd = nullptr;

  writeExact(pipe.writeEnd, data);
  pipe.writeEnd = nullptr;

  int status = waitForStatus(child);
  KJ_EXPECT(WIFEXITED(status) && WEXITSTATUS(status) == 0, status);
}

KJ_TEST("closed peer is reported as disconnected") {
  auto pipe = Pipe::make();
  byte partial[3] = { 1, 2, 3 };
  writeExact(pipe.writeEnd, partial);
  pipe.writeEnd = nullptr;

  kj::FixedArray<byte, RESPONSE_FRAME_SIZE> response;
  KJ_IF_MAYBE(e, kj::runCatchingExceptions([&]() { readExact(pipe.readEnd, response); })) {
    KJ_EXPECT(isClosedChannel(*e), *e);
  } else {
    KJ_FAIL_EXPECT("readExact() should have failed");
  }
}

class IntervalAlarm {
  // Raises SIGALRM every 10ms for as long as it lives. The handler is installed without
  // SA_RESTART, so blocking pipe reads and writes in this process fail with EINTR.

public:
  IntervalAlarm() {
    struct sigaction action;
    memset(&action, 0, sizeof(action));
    action.sa_handler = [](int) {};
    KJ_SYSCALL(sigaction(SIGALRM, &action, &oldAction));

    struct itimerval timer;
    memset(&timer, 0, sizeof(timer));
    timer.it_interval.tv_usec = 10000;
    timer.it_value.tv_usec = 10000;
    KJ_SYSCALL(setitimer(ITIMER_REAL, &timer, nullptr));
  }

  ~IntervalAlarm() noexcept(false) {
    struct itimerval off;
    memset(&off, 0, sizeof(off));
    KJ_SYSCALL(setitimer(ITIMER_REAL, &off, nullptr));
    KJ_SYSCALL(sigaction(SIGALRM, &oldAction, nullptr));
  }

  KJ_DISALLOW_COPY(IntervalAlarm);

private:
  struct sigaction oldAction;
};

KJ_TEST("reads survive interruption by signals") {
  auto pipe = Pipe::make();

  pid_t child;
  KJ_SYSCALL(child = fork());
  if (child == 0) {
    KJ_DEFER(_exit(1));
    pipe.readEnd = nullptr;
    usleep(100000);
    writeExact(pipe.writeEnd, encodePid(4242));
    _exit(0);
  }
  pipe.writeEnd = nullptr;

  kj::FixedArray<byte, RESPONSE_FRAME_SIZE> response;
  {
    IntervalAlarm alarm;
    readExact(pipe.readEnd, response);
  }
  KJ_EXPECT(decodePid(response) == 4242);

  int status = waitForStatus(child);
  KJ_EXPECT(WIFEXITED(status) && WEXITSTATUS(status) == 0);
}

KJ_TEST("fragmented reads survive interruption by signals") {
  auto pipe = Pipe::make();
  auto frame = encodeForkRequest("interrupted", "/var/run/netns/cni-0123456789abcdef");

  pid_t child;
  KJ_SYSCALL(child = fork());
  if (child == 0) {
    KJ_DEFER(_exit(1));
    pipe.readEnd = nullptr;
    // Several alarms fire in each gap, so the reader is interrupted with part of the frame
    // already received.
    for (size_t i = 0; i < frame.size(); i += 32) {
      writeExact(pipe.writeEnd, kj::arrayPtr(frame.begin() + i, 32));
      usleep(25000);
    }
    _exit(0);
  }
  pipe.writeEnd = nullptr;

  kj::FixedArray<byte, REQUEST_FRAME_SIZE> received;
  {
    IntervalAlarm alarm;
    readExact(pipe.readEnd, received);
  }
  for (size_t i = 0; i < frame.size(); i++) {
    KJ_EXPECT(received[i] == frame[i], i);
  }

  auto request = decodeForkRequest(received);
  KJ_EXPECT(request.sandboxId == "interrupted");
  KJ_EXPECT(request.netnsPath == "/var/run/netns/cni-0123456789abcdef");

  int status = waitForStatus(child);
  KJ_EXPECT(WIFEXITED(status) && WEXITSTATUS(status) == 0);
}

KJ_TEST("writes into a full pipe survive interruption by signals") {
  auto pipe = Pipe::make();
  auto data = kj::heapArray<byte>(256 * 1024);
  for (size_t i = 0; i < data.size(); i++) {
    data[i] = (i * 7) % 253;
  }

  pid_t child;
  KJ_SYSCALL(child = fork());
  if (child == 0) {
    KJ_DEFER(_exit(1));
    pipe.writeEnd = nullptr;
    // Drain slowly so the writer spends most of its time blocked on a full pipe.
    auto received = kj::heapArray<byte>(data.size());
    for (size_t i = 0; i < received.size(); i += 8192) {
      usleep(5000);
      readExact(pipe.readEnd, received.slice(i, i + 8192));
    }
    _exit(memcmp(received.begin(), data.begin(), data.size()) == 0 ? 0 : 2);
  }
  pipe.readEnd = nullptr;

  {
    IntervalAlarm alarm;
    writeExact(pipe.writeEnd, data);
  }
  pipe.writeEnd = nullptr;

  int status = waitForStatus(child);
  KJ_EXPECT(WIFEXITED(status) && WEXITSTATUS(status) == 0, status);
}

}  // namespace
}  // namespace sandboxer
