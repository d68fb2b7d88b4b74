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

#ifndef MEMOSTORE_INTERNAL_MEMO_SHARD_ROUTER_H_
#define MEMOSTORE_INTERNAL_MEMO_SHARD_ROUTER_H_

#include <stddef.h>
#include <stdint.h>

#include <cassert>
#include <utility>

namespace memostore {
namespace internal_memo {

/// Returns `true` if `shard_count` is a non-zero power of two.
constexpr bool IsValidShardCount(size_t shard_count) {
  return shard_count != 0 && (shard_count & (shard_count - 1)) == 0;
}

/// Maps keys to shard indices using the low bits of `Hash`.
///
/// Identical keys always map to the same shard.  Distinct keys may map to the
/// same shard; keys whose hashes are equal always do, for every shard count.
///
/// \tparam Hash Function object invocable as `hash(key)`, returning an
///     unsigned integer of at most 64 bits.
template <typename Key, typename Hash>
class ShardRouter {
 public:
  /// \param shard_count Must satisfy `IsValidShardCount(shard_count)`.
  ShardRouter(size_t shard_count, Hash hash)
      : mask_(shard_count - 1), hash_(std::move(hash)) {
    assert(IsValidShardCount(shard_count));
  }

  size_t operator()(const Key& key) const {
    return static_cast<size_t>(static_cast<uint64_t>(hash_(key)) & mask_);
  }

  size_t shard_count() const { return mask_ + 1; }

  const Hash& hash_function() const { return hash_; }

 private:
  size_t mask_;
  Hash hash_;
};

}  // namespace internal_memo
}  // namespace memostore

#endif  // MEMOSTORE_INTERNAL_MEMO_SHARD_ROUTER_H_
