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

#ifndef MEMOSTORE_INTERNAL_MULTI_BARRIER_H_
#define MEMOSTORE_INTERNAL_MULTI_BARRIER_H_

#include <stdint.h>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

namespace memostore {
namespace internal {

/// Reusable barrier for a fixed number of threads.
///
/// Each round completes once `num_threads` threads have called `Block()`;
/// the barrier is then immediately ready for the next round.
class MultiBarrier {
 public:
  /// Construct a MultiBarrier.
  ///
  /// \param num_threads  Number of threads that participate in the barrier.
  explicit MultiBarrier(int num_threads);
  ~MultiBarrier();

  MultiBarrier(const MultiBarrier&) = delete;
  MultiBarrier& operator=(const MultiBarrier&) = delete;

  /// Blocks the current thread, and returns only when the `num_threads`
  /// threshold of threads utilizing this barrier has been reached. `Block()`
  /// returns `true` for precisely one caller in each round.
  bool Block();

 private:
  absl::Mutex mutex_;
  const int num_threads_;
  int arrived_ ABSL_GUARDED_BY(mutex_) = 0;
  // Threads of a completed round that have not yet returned from Block().
  int leaving_ ABSL_GUARDED_BY(mutex_) = 0;
  uint64_t round_ ABSL_GUARDED_BY(mutex_) = 0;
};

}  // namespace internal
}  // namespace memostore

#endif  // MEMOSTORE_INTERNAL_MULTI_BARRIER_H_
