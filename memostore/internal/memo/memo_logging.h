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

#ifndef MEMOSTORE_INTERNAL_MEMO_MEMO_LOGGING_H_
#define MEMOSTORE_INTERNAL_MEMO_MEMO_LOGGING_H_

#include "memostore/internal/log/verbose_flag.h"

namespace memostore {
namespace internal_memo {

/// Verbose logging for memo caches, enabled with
/// `--memostore_verbose_logging=memo_cache` (factory failures) or
/// `--memostore_verbose_logging=memo_cache=1` (every computation).
extern internal_log::VerboseFlag memo_cache_logging;

}  // namespace internal_memo
}  // namespace memostore

#endif  // MEMOSTORE_INTERNAL_MEMO_MEMO_LOGGING_H_
