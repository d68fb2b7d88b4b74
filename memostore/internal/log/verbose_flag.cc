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

#include "memostore/internal/log/verbose_flag.h"

#include <stddef.h>

#include <atomic>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "absl/base/attributes.h"
#include "absl/base/const_init.h"
#include "absl/base/optimization.h"
#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/flags/flag.h"
#include "absl/log/absl_log.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_split.h"
#include "absl/synchronization/mutex.h"
#include "memostore/internal/env.h"

ABSL_FLAG(std::string, memostore_verbose_logging, {},
          "comma-separated list of memostore verbose logging flags")
    .OnUpdate([]() {
      if (!absl::GetFlag(FLAGS_memostore_verbose_logging).empty()) {
        memostore::internal_log::UpdateVerboseLogging(
            absl::GetFlag(FLAGS_memostore_verbose_logging), true);
      }
    });

namespace memostore {
namespace internal_log {
namespace {

constexpr int kMinLevel = -1;
constexpr int kMaxLevel = 1000;

// Guards the level configuration and the list of registered flags.
ABSL_CONST_INIT absl::Mutex g_mutex(absl::kConstInit);

// Intrusive singly-linked list of every VerboseFlag seen so far.  Entries are
// only ever prepended, under `g_mutex`.
ABSL_CONST_INIT VerboseFlag* g_list_head ABSL_GUARDED_BY(g_mutex) = nullptr;

struct LevelConfig {
  // Level used for names that are not listed; -1 disables them.
  int default_level = kMinLevel;
  absl::flat_hash_map<std::string, int> levels;

  int LevelFor(std::string_view name) const {
    auto it = levels.find(name);
    return it == levels.end() ? default_level : it->second;
  }
};

// Parses `input` into `config`.  Malformed entries are ignored.
void ParseLevelConfig(std::string_view input, LevelConfig& config) {
  for (std::string_view item : absl::StrSplit(input, ',', absl::SkipEmpty())) {
    const size_t eq = item.rfind('=');
    if (eq == item.npos) {
      config.levels.insert_or_assign(std::string(item), 0);
      continue;
    }
    if (eq == 0) continue;
    int level;
    if (!absl::SimpleAtoi(item.substr(eq + 1), &level)) continue;
    if (level < kMinLevel) {
      level = kMinLevel;
    } else if (level > kMaxLevel) {
      level = kMaxLevel;
    }
    config.levels.insert_or_assign(std::string(item.substr(0, eq)), level);
  }
  auto all = config.levels.find("all");
  config.default_level = all == config.levels.end() ? kMinLevel : all->second;
}

// The live configuration.  The environment variable is consulted on first use.
LevelConfig& GlobalLevelConfig() ABSL_EXCLUSIVE_LOCKS_REQUIRED(g_mutex) {
  static LevelConfig* config = [] {
    auto* config = new LevelConfig;
    if (auto env = internal::GetEnv("MEMOSTORE_VERBOSE_LOGGING"); env) {
      ParseLevelConfig(*env, *config);
    }
    return config;
  }();
  return *config;
}

}  // namespace

void UpdateVerboseLogging(std::string_view input, bool overwrite)
    ABSL_LOCKS_EXCLUDED(g_mutex) {
  ABSL_LOG(INFO) << "--memostore_verbose_logging=" << input;
  LevelConfig update;
  ParseLevelConfig(input, update);

  absl::MutexLock lock(&g_mutex);
  LevelConfig& config = GlobalLevelConfig();
  if (overwrite) {
    config = std::move(update);
  } else {
    if (update.levels.find("all") != update.levels.end()) {
      config.default_level = update.default_level;
    }
    for (auto& [name, level] : update.levels) {
      config.levels.insert_or_assign(name, level);
    }
  }

  for (VerboseFlag* flag = g_list_head; flag != nullptr; flag = flag->next_) {
    flag->value_.store(config.LevelFor(flag->name_), std::memory_order_seq_cst);
  }
}

/* static */
int VerboseFlag::RegisterVerboseFlag(VerboseFlag* flag) {
  absl::MutexLock lock(&g_mutex);
  int old_v = flag->value_.load(std::memory_order_relaxed);
  if (old_v == kValueUninitialized) {
    // First registration: pick up the configured level and link the flag so
    // that later updates reach it.
    old_v = GlobalLevelConfig().LevelFor(flag->name_);
    flag->value_.store(old_v, std::memory_order_relaxed);
    flag->next_ = std::exchange(g_list_head, flag);
  }
  return old_v;
}

/* static */
bool VerboseFlag::VerboseFlagSlowPath(VerboseFlag* flag, int old_v, int level) {
  if (ABSL_PREDICT_TRUE(old_v != kValueUninitialized)) {
    return level >= 0;
  }
  old_v = RegisterVerboseFlag(flag);
  return ABSL_PREDICT_FALSE(old_v >= level);
}

static_assert(std::is_trivially_destructible<VerboseFlag>::value,
              "VerboseFlag must be trivially destructible");

}  // namespace internal_log
}  // namespace memostore
