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

#include "memostore/memo_options.h"

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "memostore/internal/memo/shard_router.h"

namespace memostore {

absl::Status ValidateMemoOptions(const MemoOptions& options) {
  if (!internal_memo::IsValidShardCount(options.shard_count)) {
    return absl::InvalidArgumentError(
        absl::StrCat("shard_count must be a non-zero power of two, but is ",
                     options.shard_count));
  }
  return absl::OkStatus();
}

}  // namespace memostore
