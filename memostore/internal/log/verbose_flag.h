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

#ifndef MEMOSTORE_INTERNAL_LOG_VERBOSE_FLAG_H_
#define MEMOSTORE_INTERNAL_LOG_VERBOSE_FLAG_H_

#include <atomic>
#include <limits>
#include <string_view>

#include "absl/base/attributes.h"
#include "absl/base/optimization.h"

namespace memostore {
namespace internal_log {

/// Sets the verbose logging levels.  `input` is a comma separated list of
/// names or name=level values, which are reflected in the VerboseFlag objects.
/// The special name "all" sets the level of every flag not otherwise named.
///
/// When `overwrite` is false the new values are merged into the existing
/// configuration.
void UpdateVerboseLogging(std::string_view input, bool overwrite);

/// VerboseFlag gates verbose logging for one named component.  The levels are
/// taken from the `--memostore_verbose_logging` flag or the
/// `MEMOSTORE_VERBOSE_LOGGING` environment variable.
///
/// A VerboseFlag must have static storage duration:
///
///   namespace {
///     ABSL_CONST_INIT internal_log::VerboseFlag shard_logging("shards");
///   }
///   ABSL_LOG_IF(INFO, shard_logging) << "Shard locked";
///   ABSL_LOG_IF(INFO, shard_logging.Level(1)) << "Entry inserted";
///
class VerboseFlag {
 public:
  constexpr static int kValueUninitialized = std::numeric_limits<int>::max();

  explicit constexpr VerboseFlag(const char* name)
      : value_(kValueUninitialized), name_(name), next_(nullptr) {}

  VerboseFlag(const VerboseFlag&) = delete;
  VerboseFlag& operator=(const VerboseFlag&) = delete;

  /// Returns whether logging is enabled for the flag at the given level.
  /// `level` must be >= 0.
  ABSL_ATTRIBUTE_ALWAYS_INLINE
  bool Level(int level) {
    int v = value_.load(std::memory_order_relaxed);
    if (ABSL_PREDICT_TRUE(level > v)) {
      return false;
    }
    return VerboseFlagSlowPath(this, v, level);
  }

  /// Returns whether logging is enabled for the flag at level 0.
  ABSL_ATTRIBUTE_ALWAYS_INLINE
  operator bool() { return Level(0); }

  const char* name() const { return name_; }

 private:
  static bool VerboseFlagSlowPath(VerboseFlag* flag, int old_v, int level);
  static int RegisterVerboseFlag(VerboseFlag* flag);

  std::atomic<int> value_;
  const char* const name_;
  VerboseFlag* next_;  // Read under global lock.

  friend void UpdateVerboseLogging(std::string_view, bool);
};

}  // namespace internal_log
}  // namespace memostore

#endif  // MEMOSTORE_INTERNAL_LOG_VERBOSE_FLAG_H_
