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

/// \file memo_benchmark hammers a MemoCache from several threads for a fixed
/// duration and reports throughput and cache statistics.
///
/* Examples

./memo_benchmark --threads=16 --num_keys=10000 --duration=10s

./memo_benchmark --shard_count=1 --factory_latency=1ms \
  --memostore_verbose_logging=memo_cache
*/

#include <stddef.h>
#include <stdint.h>

#include <atomic>
#include <iostream>
#include <memory>
#include <string>
#include <thread>  // NOLINT
#include <utility>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/hash/hash.h"
#include "absl/log/absl_check.h"
#include "absl/log/absl_log.h"
#include "absl/random/random.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "memostore/hash/fnv1a.h"
#include "memostore/internal/multi_barrier.h"
#include "memostore/memo_cache.h"
#include "memostore/memo_options.h"
#include "memostore/util/result.h"
#include "memostore/util/status.h"

ABSL_FLAG(size_t, threads, 8, "Number of threads calling Get");
ABSL_FLAG(size_t, num_keys, 1000, "Number of distinct keys");
ABSL_FLAG(size_t, shard_count, memostore::kDefaultShardCount,
          "Number of cache shards; must be a power of two");
ABSL_FLAG(absl::Duration, duration, absl::Seconds(5), "Duration of Get loop");
ABSL_FLAG(absl::Duration, factory_latency, absl::ZeroDuration(),
          "Time spent by the factory computing each value");
ABSL_FLAG(bool, use_fnv1a, false,
          "Route keys with FNV-1a instead of absl::Hash");

namespace memostore {
namespace {

using Value = std::shared_ptr<const std::string>;

Result<Value> ComputeValue(const std::string& key) {
  const absl::Duration latency = absl::GetFlag(FLAGS_factory_latency);
  if (latency > absl::ZeroDuration()) absl::SleepFor(latency);
  return std::make_shared<const std::string>(absl::StrCat("value:", key));
}

template <typename Hash>
void DoDurationBenchmark(const std::vector<std::string>& keys) {
  const size_t num_threads = absl::GetFlag(FLAGS_threads);
  MemoOptions options;
  options.shard_count = absl::GetFlag(FLAGS_shard_count);

  auto cache_result =
      MemoCache<std::string, Value, Hash>::Make(options, Hash(), &ComputeValue);
  MEMOSTORE_CHECK_OK(cache_result);
  auto& cache = **cache_result;

  std::cout << "Starting memo benchmark for " << absl::GetFlag(FLAGS_duration)
            << " with " << num_threads << " threads, " << keys.size()
            << " keys, " << cache.shard_count() << " shards" << std::endl;

  std::atomic<uint64_t> num_gets{0};
  std::atomic<uint64_t> num_errors{0};
  internal::MultiBarrier start(num_threads + 1);
  absl::Time end_time;

  std::vector<std::thread> threads;
  threads.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([&] {
      absl::InsecureBitGen gen;
      start.Block();
      uint64_t gets = 0;
      while (absl::Now() < end_time) {
        const auto& key = keys[absl::Uniform(gen, size_t{0}, keys.size())];
        auto value = cache.Get(key);
        if (!value.ok()) {
          num_errors.fetch_add(1, std::memory_order_relaxed);
        }
        ++gets;
      }
      num_gets.fetch_add(gets, std::memory_order_relaxed);
    });
  }

  const absl::Time start_time = absl::Now();
  end_time = start_time + absl::GetFlag(FLAGS_duration);
  start.Block();
  for (auto& thread : threads) thread.join();

  const double elapsed_s =
      absl::FDivDuration(absl::Now() - start_time, absl::Seconds(1));
  const uint64_t gets = num_gets.load();
  std::cout << "Get: "
            << absl::StrFormat("%d ops in %.0f ms:  %.0f ops/second", gets,
                               elapsed_s * 1e3, gets / elapsed_s)
            << std::endl;
  std::cout << "Entries: " << cache.size() << ", errors: " << num_errors.load()
            << std::endl;
  std::cout << "Statistics: " << cache.statistics() << std::endl;
}

void Run() {
  ABSL_CHECK(absl::GetFlag(FLAGS_duration) > absl::ZeroDuration());
  ABSL_CHECK(absl::GetFlag(FLAGS_duration) != absl::InfiniteDuration());
  ABSL_CHECK(absl::GetFlag(FLAGS_threads) > 0);
  ABSL_CHECK(absl::GetFlag(FLAGS_num_keys) > 0);

  std::vector<std::string> keys;
  keys.reserve(absl::GetFlag(FLAGS_num_keys));
  for (size_t i = 0; i < absl::GetFlag(FLAGS_num_keys); ++i) {
    keys.push_back(absl::StrCat("key/", i));
  }

  if (absl::GetFlag(FLAGS_use_fnv1a)) {
    ABSL_LOG(INFO) << "Routing keys with FNV-1a";
    DoDurationBenchmark<Fnv1aHash>(keys);
  } else {
    DoDurationBenchmark<absl::Hash<std::string>>(keys);
  }
  std::cout << "Done" << std::endl;
}

}  // namespace
}  // namespace memostore

int main(int argc, char** argv) {
  absl::ParseCommandLine(argc, argv);
  memostore::Run();
  return 0;
}
