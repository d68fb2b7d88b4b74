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

#include "memostore/internal/memo/shard_router.h"

#include <stddef.h>
#include <stdint.h>

#include <string>

#include <gtest/gtest.h>
#include "absl/hash/hash.h"
#include "memostore/hash/fnv1a.h"

namespace {

using ::memostore::Fnv1aHash;
using ::memostore::internal_memo::IsValidShardCount;
using ::memostore::internal_memo::ShardRouter;

// Returns the key itself, so that the routed index is directly predictable.
struct IdentityHash {
  uint64_t operator()(uint64_t key) const { return key; }
};

TEST(IsValidShardCountTest, Basic) {
  EXPECT_FALSE(IsValidShardCount(0));
  EXPECT_TRUE(IsValidShardCount(1));
  EXPECT_TRUE(IsValidShardCount(2));
  EXPECT_FALSE(IsValidShardCount(3));
  EXPECT_TRUE(IsValidShardCount(64));
  EXPECT_FALSE(IsValidShardCount(96));
  EXPECT_TRUE(IsValidShardCount(size_t{1} << 20));
}

TEST(ShardRouterTest, UsesLowBits) {
  ShardRouter<uint64_t, IdentityHash> router(8, IdentityHash{});
  EXPECT_EQ(8, router.shard_count());
  EXPECT_EQ(0, router(0));
  EXPECT_EQ(7, router(7));
  EXPECT_EQ(0, router(8));
  EXPECT_EQ(5, router(0xff00000000000005ull));
}

TEST(ShardRouterTest, SingleShard) {
  ShardRouter<uint64_t, IdentityHash> router(1, IdentityHash{});
  for (uint64_t key : {0ull, 1ull, 12345ull, ~0ull}) {
    EXPECT_EQ(0, router(key));
  }
}

TEST(ShardRouterTest, Deterministic) {
  ShardRouter<std::string, absl::Hash<std::string>> router(
      64, absl::Hash<std::string>());
  for (int i = 0; i < 1000; ++i) {
    const std::string key = std::to_string(i);
    const size_t index = router(key);
    EXPECT_LT(index, 64);
    EXPECT_EQ(index, router(std::string(key)));
  }
}

TEST(ShardRouterTest, CollidingHashesShareShardForEveryCount) {
  for (size_t shard_count = 1; shard_count <= 1024; shard_count *= 2) {
    ShardRouter<std::string, Fnv1aHash> router(shard_count, Fnv1aHash{});
    EXPECT_EQ(router("7mohtcOFVz"), router("c1E51sSEyx")) << shard_count;
  }
}

TEST(ShardRouterTest, DistinctSingleCharactersSeparate) {
  for (size_t shard_count = 2; shard_count <= 1024; shard_count *= 2) {
    ShardRouter<std::string, Fnv1aHash> router(shard_count, Fnv1aHash{});
    EXPECT_NE(router("a"), router("b")) << shard_count;
  }
}

}  // namespace
