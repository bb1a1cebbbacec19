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
#include <kj/debug.h>
#include <string.h>

namespace sandboxer {

void validateForkRequest(kj::StringPtr sandboxId, kj::StringPtr netnsPath) {
  KJ_REQUIRE(sandboxId.size() <= SANDBOX_ID_SIZE, "sandbox id too long",
             sandboxId, SANDBOX_ID_SIZE);
  KJ_REQUIRE(netnsPath.size() <= MAX_NETNS_PATH_SIZE, "netns path too long",
             netnsPath, MAX_NETNS_PATH_SIZE);
  KJ_REQUIRE(memchr(sandboxId.begin(), '\0', sandboxId.size()) == nullptr,
             "sandbox id contains NUL");
  KJ_REQUIRE(memchr(netnsPath.begin(), '\0', netnsPath.size()) == nullptr,
             "netns path contains NUL");
}

kj::FixedArray<byte, REQUEST_FRAME_SIZE> encodeForkRequest(
    kj::StringPtr sandboxId, kj::StringPtr netnsPath) {
  validateForkRequest(sandboxId, netnsPath);

  kj::FixedArray<byte, REQUEST_FRAME_SIZE> frame;
  memset(frame.begin(), 0, frame.size());
  memcpy(frame.begin(), sandboxId.begin(), sandboxId.size());
  memcpy(frame.begin() + SANDBOX_ID_SIZE, netnsPath.begin(), netnsPath.size());
  return frame;
}

ForkRequest decodeForkRequest(kj::ArrayPtr<const byte> frame) {
  KJ_REQUIRE(frame.size() == REQUEST_FRAME_SIZE, "bad request frame size", frame.size());

  auto idRegion = frame.slice(0, SANDBOX_ID_SIZE);
  auto idEnd = reinterpret_cast<const byte*>(memchr(idRegion.begin(), '\0', idRegion.size()));
  size_t idSize = idEnd == nullptr ? idRegion.size() : idEnd - idRegion.begin();

  auto pathRegion = frame.slice(SANDBOX_ID_SIZE, frame.size());
  auto pathEnd = reinterpret_cast<const byte*>(
      memchr(pathRegion.begin(), '\0', pathRegion.size()));
  KJ_REQUIRE(pathEnd != nullptr, "netns path in request frame is not NUL-terminated");

  return ForkRequest {
    kj::heapString(reinterpret_cast<const char*>(idRegion.begin()), idSize),
    kj::heapString(reinterpret_cast<const char*>(pathRegion.begin()),
                   pathEnd - pathRegion.begin())
  };
}

kj::FixedArray<byte, RESPONSE_FRAME_SIZE> encodePid(int32_t pid) {
  uint32_t value = static_cast<uint32_t>(pid);
  kj::FixedArray<byte, RESPONSE_FRAME_SIZE> frame;
  for (uint i = 0; i < RESPONSE_FRAME_SIZE; i++) {
    frame[i] = static_cast<byte>(value >> (8 * i));
  }
  return frame;
}

int32_t decodePid(kj::ArrayPtr<const byte> frame) {
  KJ_REQUIRE(frame.size() == RESPONSE_FRAME_SIZE, "bad response frame size", frame.size());
  uint32_t value = 0;
  for (uint i = 0; i < RESPONSE_FRAME_SIZE; i++) {
    value |= static_cast<uint32_t>(frame[i]) << (8 * i);
  }
  return static_cast<int32_t>(value);
}

void readExact(int fd, kj::ArrayPtr<byte> buffer) {
  size_t pos = 0;
  while (pos < buffer.size()) {
    // KJ_SYSCALL retries EINTR itself.
    ssize_t n;
    KJ_SYSCALL(n = read(fd, buffer.begin() + pos, buffer.size() - pos));
    if (n == 0) {
      kj::throwFatalException(KJ_EXCEPTION(DISCONNECTED, "channel closed by peer",
                                            pos, buffer.size()));
    }
    pos += n;
  }
}

void writeExact(int fd, kj::ArrayPtr<const byte> buffer) {
  size_t pos = 0;
  while (pos < buffer.size()) {
    ssize_t n;
    KJ_SYSCALL(n = write(fd, buffer.begin() + pos, buffer.size() - pos));
    pos += n;
  }
}

bool isClosedChannel(const kj::Exception& exception) {
  return exception.getType() == kj::Exception::Type::DISCONNECTED;
}

}  // namespace sandboxer
