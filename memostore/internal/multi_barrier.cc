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

#include "memostore/internal/multi_barrier.h"

#include <stdint.h>

#include <cassert>

#include "absl/synchronization/mutex.h"

namespace memostore {
namespace internal {

MultiBarrier::MultiBarrier(int num_threads) : num_threads_(num_threads) {
  assert(num_threads > 0);
}

MultiBarrier::~MultiBarrier() {
  // Wait for the last round's threads to leave Block() before the mutex is
  // destroyed.
  absl::MutexLock lock(&mutex_);
  mutex_.Await(absl::Condition(
      +[](int* leaving) { return *leaving == 0; }, &leaving_));
}

bool MultiBarrier::Block() {
  absl::MutexLock lock(&mutex_);
  const uint64_t round = round_;
  if (++arrived_ == num_threads_) {
    // Last arrival releases the round.
    arrived_ = 0;
    leaving_ += num_threads_ - 1;
    ++round_;
    return true;
  }
  struct RoundArgs {
    uint64_t* current;
    uint64_t waiting_for;
  } args{&round_, round};
  mutex_.Await(absl::Condition(
      +[](RoundArgs* a) { return *a->current != a->waiting_for; }, &args));
  --leaving_;
  return false;
}

}  // namespace internal
}  // namespace memostore
