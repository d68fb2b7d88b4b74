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

#ifndef MEMOSTORE_MEMO_OPTIONS_H_
#define MEMOSTORE_MEMO_OPTIONS_H_

#include <stddef.h>

#include "absl/status/status.h"

namespace memostore {

/// Number of shards used when none is specified.
constexpr size_t kDefaultShardCount = 64;

/// Construction-time configuration of a `MemoCache`.
struct MemoOptions {
  /// Number of independently locked shards.  Must be a non-zero power of two.
  /// Fixed for the lifetime of the cache.
  size_t shard_count = kDefaultShardCount;
};

/// Returns `absl::StatusCode::kInvalidArgument` if `options` cannot be used to
/// construct a cache.
absl::Status ValidateMemoOptions(const MemoOptions& options);

}  // namespace memostore

#endif  // MEMOSTORE_MEMO_OPTIONS_H_
