// Copyright 2026 The Memostore Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef MEMOSTORE_HASH_FNV1A_H_
#define MEMOSTORE_HASH_FNV1A_H_

/// \file
/// 64-bit FNV-1a hash.
///
/// Unlike `absl::Hash`, which is seeded per process, FNV-1a yields the same
/// value for the same bytes in every run.  That makes it suitable for choosing
/// keys that deliberately share (or do not share) a shard of a `MemoCache`.
/// It is not resistant to adversarial keys.

#include <stddef.h>
#include <stdint.h>

#include <string_view>
#include <type_traits>

namespace memostore {

constexpr uint64_t kFnv1aOffsetBasis = 0xcbf29ce484222325ull;
constexpr uint64_t kFnv1aPrime = 0x100000001b3ull;

/// Continues an FNV-1a hash from `state` over `bytes`.
constexpr uint64_t Fnv1aHashBytes(std::string_view bytes,
                                  uint64_t state = kFnv1aOffsetBasis) {
  for (char c : bytes) {
    state ^= static_cast<unsigned char>(c);
    state *= kFnv1aPrime;
  }
  return state;
}

/// Hash functor computing FNV-1a over the bytes of a string, or over the
/// little-endian bytes of an integer.
struct Fnv1aHash {
  constexpr uint64_t operator()(std::string_view value) const {
    return Fnv1aHashBytes(value);
  }

  template <typename T,
            std::enable_if_t<std::is_integral_v<T> &&
                             !std::is_same_v<T, bool>>* = nullptr>
  constexpr uint64_t operator()(T value) const {
    using U = std::make_unsigned_t<T>;
    U bits = static_cast<U>(value);
    uint64_t state = kFnv1aOffsetBasis;
    for (size_t i = 0; i < sizeof(U); ++i) {
      state ^= static_cast<uint8_t>(bits >> (8 * i));
      state *= kFnv1aPrime;
    }
    return state;
  }
};

}  // namespace memostore

#endif  // MEMOSTORE_HASH_FNV1A_H_
