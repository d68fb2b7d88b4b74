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

#ifndef MEMOSTORE_UTIL_RESULT_H_
#define MEMOSTORE_UTIL_RESULT_H_

#include <type_traits>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "memostore/util/status.h"  // IWYU pragma: export

namespace memostore {

/// `Result<T>` holds either a successfully-computed `T` or an error
/// `absl::Status`.
///
/// Example::
///
///     Result<int> ParsePort(std::string_view s);
///
///     Result<int> port = ParsePort("8080");
///     if (!port.ok()) return port.status();
///     Use(*port);
///
/// \ingroup error handling
template <typename T>
using Result = absl::StatusOr<T>;

/// Evaluates to `true` if `T` is an instance of `Result`.
template <typename T>
constexpr inline bool IsResult = false;

template <typename T>
constexpr inline bool IsResult<absl::StatusOr<T>> = true;

/// Returns the error status of `result`, or `absl::OkStatus()`.
///
/// \relates Result
template <typename T>
const absl::Status& GetStatus(const Result<T>& result) {
  return result.status();
}
template <typename T>
absl::Status GetStatus(Result<T>&& result) {
  return std::move(result).status();
}

}  // namespace memostore

#endif  // MEMOSTORE_UTIL_RESULT_H_
