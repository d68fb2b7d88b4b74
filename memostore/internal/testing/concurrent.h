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

#ifndef MEMOSTORE_INTERNAL_TESTING_CONCURRENT_H_
#define MEMOSTORE_INTERNAL_TESTING_CONCURRENT_H_

#include <stddef.h>

#include <algorithm>
#include <atomic>
#include <thread>  // NOLINT
#include <type_traits>
#include <utility>
#include <vector>

#include "memostore/internal/multi_barrier.h"

namespace memostore {
namespace internal_testing {

/// Repeatedly calls `initialize()`, then calls `concurrent_ops()...`
/// concurrently from separate threads, then calls `finalize()` after the
/// `concurrent_ops` finish.
///
/// This is repeated `num_iterations` times.
///
/// Example:
///
///   std::atomic<int> sum{0};
///   TestConcurrent(
///      /*num_iterations=*/100,
///      /*initialize=*/[&] {},
///      /*finalize=*/[&] {},
///      /* concurrent_ops = ... */
///      [&]() { sum += 1; },
///      [&]() { sum += 2; },
///      [&]() { sum += 3; });
///
template <typename Initialize, typename Finalize, typename... ConcurrentOps>
void TestConcurrent(size_t num_iterations, Initialize initialize,
                    Finalize finalize, ConcurrentOps... concurrent_ops) {
  std::atomic<size_t> counter(0);
  constexpr size_t concurrent_op_size = sizeof...(ConcurrentOps);

  // Every thread, and the caller, meet at a barrier before and after the
  // concurrent ops of each iteration.
  internal::MultiBarrier sync_point(1 + concurrent_op_size);

  // Busy-wait so that groups of up to 4 threads start their op together.
  size_t sync_mask =
      std::min(4u, std::max(1u, std::thread::hardware_concurrency())) - 1;
  if (sync_mask == 2) sync_mask--;

  std::vector<std::thread> threads;
  threads.reserve(concurrent_op_size);
  (threads.emplace_back([&, op = std::move(concurrent_ops)] {
    for (size_t iteration = 0; iteration < num_iterations; ++iteration) {
      // Wait until `initialize` has run for this iteration.
      sync_point.Block();

      size_t current = counter.fetch_add(1, std::memory_order_acq_rel) + 1;
      size_t target = std::min(current | sync_mask, concurrent_op_size);
      while (counter.load() < target) {
        std::this_thread::yield();
      }
      op();

      // Signal that the op() has completed.
      sync_point.Block();
    }
  }),
   ...);

  for (size_t iteration = 0; iteration < num_iterations; ++iteration) {
    initialize();
    counter = 0;

    sync_point.Block();
    // Wait until the op() has run.
    sync_point.Block();

    finalize();
  }

  for (auto& t : threads) {
    t.join();
  }
}

/// Repeatedly calls `initialize()`, then calls `concurrent_op(Is)...` for
/// each index in Is concurrently from separate threads, then calls
/// `finalize()` after the `concurrent_ops` finish.
template <typename Initialize, typename Finalize, typename ConcurrentOp,
          size_t... Is>
void TestConcurrent(std::index_sequence<Is...>, size_t num_iterations,
                    Initialize initialize, Finalize finalize,
                    ConcurrentOp concurrent_op) {
  TestConcurrent(
      num_iterations, std::move(initialize), std::move(finalize),
      [&] { concurrent_op(std::integral_constant<size_t, Is>{}); }...);
}

/// Calls `concurrent_op(0), ..., concurrent_op(NumConcurrentOps-1)`
/// concurrently from separate threads, `num_iterations` times.
///
/// Example:
///
///   std::atomic<int> sum{0};
///   TestConcurrent<3>(
///      /*num_iterations=*/100,
///      /*initialize=*/[&] {},
///      /*finalize=*/[&] {},
///      [&](auto i) { sum += i; });
///
template <size_t NumConcurrentOps, typename Initialize, typename Finalize,
          typename ConcurrentOp>
void TestConcurrent(size_t num_iterations, Initialize initialize,
                    Finalize finalize, ConcurrentOp concurrent_op) {
  return TestConcurrent(std::make_index_sequence<NumConcurrentOps>{},
                        num_iterations, std::move(initialize),
                        std::move(finalize), std::move(concurrent_op));
}

}  // namespace internal_testing
}  // namespace memostore

#endif  // MEMOSTORE_INTERNAL_TESTING_CONCURRENT_H_
