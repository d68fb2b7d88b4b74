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

#ifndef MEMOSTORE_INTERNAL_MEMO_SHARDED_STORE_H_
#define MEMOSTORE_INTERNAL_MEMO_SHARDED_STORE_H_

/// \file
/// Lock-striped insert-once map underlying `MemoCache`.
///
/// Each shard is a reader/writer mutex together with the hash map it guards.
/// `GetOrCreate` looks a key up under the shared lock and, on a miss, takes
/// the exclusive lock, looks again, and only then invokes the factory, still
/// holding the exclusive lock.  Holding the lock across the factory call is
/// what makes the computation single-flight; the cost is that distinct keys
/// routed to the same shard are computed one after the other.
///
/// A thread never holds more than one shard lock, so lock ordering between
/// shards cannot deadlock.  A factory that re-enters the store for a key of
/// the same shard does deadlock, since the mutex is not reentrant.

#include <stddef.h>
#include <stdint.h>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "absl/base/optimization.h"
#include "absl/base/thread_annotations.h"
#include "absl/cleanup/cleanup.h"
#include "absl/container/flat_hash_map.h"
#include "absl/hash/hash.h"
#include "absl/log/absl_log.h"
#include "absl/synchronization/mutex.h"
#include "memostore/internal/memo/memo_logging.h"
#include "memostore/internal/memo/shard_router.h"
#include "memostore/internal/mutex.h"
#include "memostore/memo_statistics.h"
#include "memostore/util/result.h"

namespace memostore {
namespace internal_memo {

/// Invokes `factory(key)` and converts the return value to `Result<Value>`.
///
/// `factory` may return either `Value` (or a type convertible to it) or
/// `Result<Value>`.
template <typename Value, typename Factory, typename Key>
Result<Value> InvokeFactory(Factory& factory, const Key& key) {
  using R = std::remove_cv_t<
      std::remove_reference_t<std::invoke_result_t<Factory&, const Key&>>>;
  if constexpr (IsResult<R>) {
    static_assert(std::is_convertible_v<R, Result<Value>>,
                  "factory returns an incompatible Result type");
    return std::invoke(factory, key);
  } else {
    static_assert(std::is_convertible_v<R, Value>,
                  "factory return type is not convertible to Value");
    return Result<Value>(std::in_place, std::invoke(factory, key));
  }
}

template <typename Key, typename Value, typename Hash = absl::Hash<Key>,
          typename Eq = std::equal_to<Key>, typename Mutex = absl::Mutex>
class ShardedStore {
 public:
  using key_type = Key;
  using mapped_type = Value;
  using Map = absl::flat_hash_map<Key, Value, Hash, Eq>;

  /// \param shard_count Must satisfy `IsValidShardCount(shard_count)`.
  explicit ShardedStore(size_t shard_count, Hash hash = Hash(), Eq eq = Eq())
      : router_(shard_count, hash) {
    shards_.reserve(shard_count);
    for (size_t i = 0; i < shard_count; ++i) {
      shards_.push_back(std::make_unique<Shard>(hash, eq));
    }
  }

  ShardedStore(const ShardedStore&) = delete;
  ShardedStore& operator=(const ShardedStore&) = delete;

  /// Returns the value for `key`, calling `make_value(key)` to compute and
  /// insert it if absent.
  ///
  /// If `make_value` returns an error or throws, nothing is inserted and the
  /// error (or exception) is passed to the caller; a later call computes the
  /// value again.
  template <typename MakeValue>
  Result<Value> GetOrCreate(const Key& key, MakeValue&& make_value) {
    const size_t index = router_(key);
    Shard& shard = *shards_[index];
    {
      internal::ScopedReaderLock<Mutex> lock(shard.mutex);
      auto it = shard.entries.find(key);
      if (ABSL_PREDICT_TRUE(it != shard.entries.end())) {
        shard.hits.fetch_add(1, std::memory_order_relaxed);
        return it->second;
      }
    }

    internal::ScopedWriterLock<Mutex> lock(shard.mutex);
    // Another thread may have inserted the value between releasing the shared
    // lock and acquiring the exclusive lock.
    auto it = shard.entries.find(key);
    if (it != shard.entries.end()) {
      shard.coalesced.fetch_add(1, std::memory_order_relaxed);
      return it->second;
    }

    ABSL_LOG_IF(INFO, memo_cache_logging.Level(1))
        << "Computing memo entry in shard " << index;
    shard.computations.fetch_add(1, std::memory_order_relaxed);
    bool inserted = false;
    absl::Cleanup count_failure = [&shard, &inserted] {
      if (!inserted) shard.failures.fetch_add(1, std::memory_order_relaxed);
    };

    Result<Value> result = InvokeFactory<Value>(make_value, key);
    if (!result.ok()) {
      ABSL_LOG_IF(INFO, memo_cache_logging)
          << "Memo factory failed in shard " << index << ": "
          << result.status();
      return result;
    }
    shard.entries.emplace(key, *result);
    inserted = true;
    return result;
  }

  /// Returns the value for `key` if it has been computed.
  std::optional<Value> Find(const Key& key) const {
    const Shard& shard = *shards_[router_(key)];
    internal::ScopedReaderLock<Mutex> lock(shard.mutex);
    auto it = shard.entries.find(key);
    if (it == shard.entries.end()) return std::nullopt;
    return it->second;
  }

  bool Contains(const Key& key) const {
    const Shard& shard = *shards_[router_(key)];
    internal::ScopedReaderLock<Mutex> lock(shard.mutex);
    return shard.entries.contains(key);
  }

  /// Inserts `value` for `key` unless `key` is already present.  A present
  /// value is never replaced.
  ///
  /// \returns `true` if inserted.
  bool Insert(Key key, Value value) {
    Shard& shard = *shards_[router_(key)];
    internal::ScopedWriterLock<Mutex> lock(shard.mutex);
    return shard.entries.try_emplace(std::move(key), std::move(value)).second;
  }

  /// Returns the number of entries.  Shards are counted one at a time.
  size_t size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
      internal::ScopedReaderLock<Mutex> lock(shard->mutex);
      total += shard->entries.size();
    }
    return total;
  }

  /// Returns a copy of all entries, in unspecified order.  Shards are copied
  /// one at a time.
  std::vector<std::pair<Key, Value>> Snapshot() const {
    std::vector<std::pair<Key, Value>> entries;
    for (const auto& shard : shards_) {
      internal::ScopedReaderLock<Mutex> lock(shard->mutex);
      entries.insert(entries.end(), shard->entries.begin(),
                     shard->entries.end());
    }
    return entries;
  }

  MemoStatistics statistics() const {
    MemoStatistics stats;
    for (const auto& shard : shards_) {
      stats.hits += shard->hits.load(std::memory_order_relaxed);
      stats.coalesced += shard->coalesced.load(std::memory_order_relaxed);
      stats.computations +=
          shard->computations.load(std::memory_order_relaxed);
      stats.failures += shard->failures.load(std::memory_order_relaxed);
    }
    return stats;
  }

  /// Returns the index of the shard that holds `key`.
  size_t ShardIndex(const Key& key) const { return router_(key); }

  size_t shard_count() const { return router_.shard_count(); }

  const Hash& hash_function() const { return router_.hash_function(); }

 private:
  // Aligned so that the locks and counters of neighbouring shards do not share
  // a cache line.
  struct ABSL_CACHELINE_ALIGNED Shard {
    Shard(const Hash& hash, const Eq& eq) : entries(0, hash, eq) {}

    mutable Mutex mutex;
    Map entries ABSL_GUARDED_BY(mutex);

    std::atomic<uint64_t> hits{0};
    std::atomic<uint64_t> coalesced{0};
    std::atomic<uint64_t> computations{0};
    std::atomic<uint64_t> failures{0};
  };

  ShardRouter<Key, Hash> router_;
  std::vector<std::unique_ptr<Shard>> shards_;
};

}  // namespace internal_memo
}  // namespace memostore

#endif  // MEMOSTORE_INTERNAL_MEMO_SHARDED_STORE_H_
