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

#ifndef MEMOSTORE_MEMO_CACHE_H_
#define MEMOSTORE_MEMO_CACHE_H_

/// \file
/// Thread-safe memoization cache that computes each value at most once.
///
/// A `MemoCache` maps keys to values computed on first access by a
/// caller-supplied factory.  Concurrent `Get` calls for the same key share a
/// single factory invocation; calls for keys that route to different shards
/// proceed in parallel.  Entries are never removed or replaced.
///
/// Example:
///
///     memostore::MemoCache<std::string, std::shared_ptr<const Schema>> cache(
///         [](const std::string& path) -> memostore::Result<
///                                            std::shared_ptr<const Schema>> {
///           return LoadSchema(path);
///         });
///     MEMOSTORE_ASSIGN_OR_RETURN(auto schema, cache.Get("a/b.json"));

#include <stddef.h>

#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "absl/hash/hash.h"
#include "absl/synchronization/mutex.h"
#include "memostore/internal/memo/sharded_store.h"
#include "memostore/memo_options.h"
#include "memostore/memo_statistics.h"
#include "memostore/util/result.h"
#include "memostore/util/status.h"

namespace memostore {

/// Memoization cache from `Key` to `Value`.
///
/// The factory is invoked as `factory(key)` and may return either `Value` or
/// `Result<Value>`.  An error (or exception) from the factory is passed to the
/// caller of `Get` and nothing is cached, so a later `Get` for the same key
/// invokes the factory again.
///
/// The factory runs while the exclusive lock of the key's shard is held.  It
/// must therefore not call `Get` for another key of the same shard; in
/// general a factory should not use the cache that invokes it.
///
/// \tparam Key Key type, hashable by `Hash` and comparable by `Eq`.
/// \tparam Value Value type.  `Get` returns copies, so expensive values are
///     typically held by `std::shared_ptr`.
/// \tparam Hash Hash function object; the low bits of its result select the
///     shard.
/// \tparam Mutex Reader/writer mutex guarding each shard.
template <typename Key, typename Value, typename Hash = absl::Hash<Key>,
          typename Eq = std::equal_to<Key>, typename Mutex = absl::Mutex>
class MemoCache {
  using Store = internal_memo::ShardedStore<Key, Value, Hash, Eq, Mutex>;

  template <typename F>
  using EnableIfFactory =
      std::enable_if_t<std::is_invocable_v<const F&, const Key&>>;

 public:
  using key_type = Key;
  using mapped_type = Value;
  using Factory = std::function<Result<Value>(const Key&)>;
  using Entries = std::vector<std::pair<Key, Value>>;

  /// Constructs an empty cache with a default-constructed `Hash` and
  /// `kDefaultShardCount` shards.
  template <typename F, typename = EnableIfFactory<F>>
  explicit MemoCache(F factory)
      : MemoCache(kDefaultShardCount, Hash(),
                  WrapFactory(std::move(factory))) {}

  /// Constructs an empty cache using the specified hash function and
  /// `kDefaultShardCount` shards.
  template <typename F, typename = EnableIfFactory<F>>
  MemoCache(Hash hash, F factory)
      : MemoCache(kDefaultShardCount, std::move(hash),
                  WrapFactory(std::move(factory))) {}

  /// Constructs a cache with the shard count given by `options`, seeded with
  /// `entries`.
  ///
  /// Seeded entries are never recomputed.  If `entries` contains a key more
  /// than once, the first value is kept.  A cache can be rebuilt with a
  /// different shard count or hash function from the `Snapshot()` of another.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` if `options` is invalid.
  template <typename F, typename = EnableIfFactory<F>>
  static Result<std::unique_ptr<MemoCache>> Make(const MemoOptions& options,
                                                 Hash hash, F factory,
                                                 Entries entries = {}) {
    MEMOSTORE_RETURN_IF_ERROR(
        ValidateMemoOptions(options),
        MaybeAnnotateStatus(_, "Cannot create memo cache"));
    std::unique_ptr<MemoCache> cache(new MemoCache(
        options.shard_count, std::move(hash), WrapFactory(std::move(factory))));
    for (auto& entry : entries) {
      cache->store_.Insert(std::move(entry.first), std::move(entry.second));
    }
    return cache;
  }

  MemoCache(const MemoCache&) = delete;
  MemoCache& operator=(const MemoCache&) = delete;

  /// Returns the value for `key`, invoking the factory if it has not been
  /// computed yet.
  ///
  /// Blocks while another thread computes a value in the same shard.
  Result<Value> Get(const Key& key) {
    return store_.GetOrCreate(key, factory_);
  }

  /// Returns the value for `key` if it has been computed.  Never invokes the
  /// factory.
  std::optional<Value> Find(const Key& key) const { return store_.Find(key); }

  bool Contains(const Key& key) const { return store_.Contains(key); }

  /// Returns the number of computed entries.
  size_t size() const { return store_.size(); }

  /// Returns a copy of all computed entries, in unspecified order.
  ///
  /// Shards are copied one at a time, so entries inserted concurrently may or
  /// may not be included.
  Entries Snapshot() const { return store_.Snapshot(); }

  size_t shard_count() const { return store_.shard_count(); }

  const Hash& hash_function() const { return store_.hash_function(); }

  MemoStatistics statistics() const { return store_.statistics(); }

 private:
  MemoCache(size_t shard_count, Hash hash, Factory factory)
      : store_(shard_count, std::move(hash)), factory_(std::move(factory)) {}

  template <typename F>
  static Factory WrapFactory(F factory) {
    return [factory = std::move(factory)](const Key& key) -> Result<Value> {
      return internal_memo::InvokeFactory<Value>(factory, key);
    };
  }

  Store store_;
  Factory factory_;
};

}  // namespace memostore

#endif  // MEMOSTORE_MEMO_CACHE_H_
