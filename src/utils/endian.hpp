// Copyright 2025 The edgeclient Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except in compliance with
// the License. You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software distributed under the License is distributed on
// an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the License for the
// specific language governing permissions and limitations under the License.


#pragma once

#include <cstdint>

#ifdef __APPLE__
#include <libkern/OSByteOrder.h>
#else
#include <endian.h>
#endif

namespace edgeclient::utils {

// Signed values are swapped through their unsigned bit pattern; both
// conversions are modular, so negative values survive the round trip.

#ifdef __APPLE__
inline int32_t HostToBigEndian(int32_t value) {
  return static_cast<int32_t>(OSSwapHostToBigInt32(static_cast<uint32_t>(value)));
}
inline int64_t HostToBigEndian(int64_t value) {
  return static_cast<int64_t>(OSSwapHostToBigInt64(static_cast<uint64_t>(value)));
}

inline int32_t BigEndianToHost(int32_t value) {
  return static_cast<int32_t>(OSSwapBigToHostInt32(static_cast<uint32_t>(value)));
}
inline int64_t BigEndianToHost(int64_t value) {
  return static_cast<int64_t>(OSSwapBigToHostInt64(static_cast<uint64_t>(value)));
}
#else
inline int32_t HostToBigEndian(int32_t value) { return static_cast<int32_t>(htobe32(static_cast<uint32_t>(value))); }
inline int64_t HostToBigEndian(int64_t value) { return static_cast<int64_t>(htobe64(static_cast<uint64_t>(value))); }

inline int32_t BigEndianToHost(int32_t value) { return static_cast<int32_t>(be32toh(static_cast<uint32_t>(value))); }
inline int64_t BigEndianToHost(int64_t value) { return static_cast<int64_t>(be64toh(static_cast<uint64_t>(value))); }
#endif

}  // namespace edgeclient::utils
