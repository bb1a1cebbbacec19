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

#ifndef SANDBOXER_CHANNEL_H_
#define SANDBOXER_CHANNEL_H_
// Fixed-size frames exchanged between the main program and the sandbox parent over a pair of
// unidirectional pipes.
//
// Request (512 bytes):
//   [0, 64)    sandbox id, zero-padded; not NUL-terminated when it is exactly 64 bytes.
//   [64, 512)  NUL-terminated path of a network namespace to join, or an immediate NUL for
//              "none", followed by zero padding.
//
// Response (4 bytes):
//   signed 32-bit little-endian. Positive: pid of the new sandbox leader. Negative: -errno of
//   the failure that prevented the sandbox from being created.
//
// There is no version field; both ends are built from this header.

#include <kj/array.h>
#include <kj/string.h>
#include <stdint.h>
#include "util.h"

namespace sandboxer {

constexpr size_t REQUEST_FRAME_SIZE = 512;
constexpr size_t SANDBOX_ID_SIZE = 64;
constexpr size_t MAX_NETNS_PATH_SIZE = 446;
constexpr size_t RESPONSE_FRAME_SIZE = 4;

struct ForkRequest {
  kj::String sandboxId;
  kj::String netnsPath;
  // Empty if the sandbox keeps the sandbox parent's network namespace.
};

void validateForkRequest(kj::StringPtr sandboxId, kj::StringPtr netnsPath);
// Throws if the id or path does not fit in its region of the request frame.

kj::FixedArray<byte, REQUEST_FRAME_SIZE> encodeForkRequest(
    kj::StringPtr sandboxId, kj::StringPtr netnsPath);
ForkRequest decodeForkRequest(kj::ArrayPtr<const byte> frame);

kj::FixedArray<byte, RESPONSE_FRAME_SIZE> encodePid(int32_t pid);
int32_t decodePid(kj::ArrayPtr<const byte> frame);

void readExact(int fd, kj::ArrayPtr<byte> buffer);
// Reads exactly buffer.size() bytes, retrying short reads and EINTR. Throws a DISCONNECTED
// exception if the write end is closed first.

void writeExact(int fd, kj::ArrayPtr<const byte> buffer);
// Writes all of `buffer`, retrying short writes and EINTR.

bool isClosedChannel(const kj::Exception& exception);
// True if `exception` reports that the peer closed its end of the pipe.

}  // namespace sandboxer

#endif // SANDBOXER_CHANNEL_H_
