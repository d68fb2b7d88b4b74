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

#ifndef MEMOSTORE_MEMO_STATISTICS_H_
#define MEMOSTORE_MEMO_STATISTICS_H_

#include <stdint.h>

#include <iosfwd>

namespace memostore {

/// Counters describing how `MemoCache::Get` calls were satisfied.
///
/// The counters are sampled shard by shard without a global lock, so a
/// snapshot taken while other threads are calling `Get` need not correspond to
/// a single instant.
struct MemoStatistics {
  /// Calls answered by the shared-lock fast path.
  uint64_t hits = 0;

  /// Calls that missed on the fast path but found the value present after
  /// acquiring the exclusive lock, because a concurrent caller computed it.
  uint64_t coalesced = 0;

  /// Factory invocations, successful or not.
  uint64_t computations = 0;

  /// Factory invocations that returned an error or threw.
  uint64_t failures = 0;

  friend bool operator==(const MemoStatistics& a, const MemoStatistics& b) {
    return a.hits == b.hits && a.coalesced == b.coalesced &&
           a.computations == b.computations && a.failures == b.failures;
  }
  friend bool operator!=(const MemoStatistics& a, const MemoStatistics& b) {
    return !(a == b);
  }

  friend std::ostream& operator<<(std::ostream& os, const MemoStatistics& s);
};

}  // namespace memostore

#endif  // MEMOSTORE_MEMO_STATISTICS_H_
