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

#ifndef MEMOSTORE_UTIL_STATUS_H_
#define MEMOSTORE_UTIL_STATUS_H_

#include <string_view>
#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"

namespace memostore {
namespace internal {

/// Writes `message` and `status` to stderr, prefixed by the source location,
/// and terminates the process.
[[noreturn]] void FatalStatus(const char* message, const absl::Status& status,
                              const char* file, int line);

}  // namespace internal

/// If `source` is not `absl::StatusCode::kOk`, returns a copy with `message`
/// prepended to the error message.  The code and payloads are preserved.
///
/// \ingroup error handling
absl::Status MaybeAnnotateStatus(absl::Status source, std::string_view message);

/// Overload for the case of a bare absl::Status argument.
///
/// \returns `status`
inline const absl::Status& GetStatus(const absl::Status& status) {
  return status;
}
inline absl::Status GetStatus(absl::Status&& status) {
  return std::move(status);
}

}  // namespace memostore

#define MEMOSTORE_INTERNAL_PP_EXPAND(...) __VA_ARGS__
#define MEMOSTORE_INTERNAL_PP_CAT_IMPL(a, b) a##b
#define MEMOSTORE_INTERNAL_PP_CAT(a, b) MEMOSTORE_INTERNAL_PP_CAT_IMPL(a, b)

/// Causes the containing function to return the specified `absl::Status` value
/// if it is an error status.
///
/// Example::
///
///     absl::Status Bar() {
///       MEMOSTORE_RETURN_IF_ERROR(GetSomeStatus());
///       return absl::OkStatus();
///     }
///
/// An optional second argument specifies the return expression in the case of
/// an error.  A variable ``_`` is bound to the value of the first expression
/// within this expression::
///
///     MEMOSTORE_RETURN_IF_ERROR(GetSomeStatus(),
///                               MaybeAnnotateStatus(_, "In Bar"));
///
/// \ingroup error handling
#define MEMOSTORE_RETURN_IF_ERROR(...) \
  MEMOSTORE_INTERNAL_PP_EXPAND(        \
      MEMOSTORE_INTERNAL_RETURN_IF_ERROR_IMPL(__VA_ARGS__, _))

#define MEMOSTORE_INTERNAL_RETURN_IF_ERROR_IMPL(expr, error_expr, ...) \
  for (absl::Status _ = ::memostore::GetStatus(expr);                  \
       ABSL_PREDICT_FALSE(!_.ok());)                                   \
  return error_expr /**/

/// Evaluates `expr`, which must yield a `Result<T>`.  On error, returns the
/// error from the containing function; otherwise assigns the value to `decl`.
///
/// An optional third argument specifies the return expression in the case of
/// an error, with ``_`` bound to the error status.
///
/// \ingroup error handling
#define MEMOSTORE_ASSIGN_OR_RETURN(decl, ...)                          \
  MEMOSTORE_INTERNAL_PP_EXPAND(MEMOSTORE_INTERNAL_ASSIGN_OR_RETURN_IMPL( \
      MEMOSTORE_INTERNAL_PP_CAT(memostore_assign_or_return_, __LINE__),  \
      decl, __VA_ARGS__, _))

#define MEMOSTORE_INTERNAL_ASSIGN_OR_RETURN_IMPL(temp, decl, expr, error_expr, \
                                                 ...)                          \
  auto temp = (expr);                                                          \
  if (ABSL_PREDICT_FALSE(!temp.ok())) {                                        \
    absl::Status _ = std::move(temp).status();                                 \
    return error_expr;                                                         \
  }                                                                            \
  decl = *std::move(temp) /**/

/// Logs an error and terminates the program if the specified `absl::Status` is
/// an error status.
///
/// \ingroup error handling
#define MEMOSTORE_CHECK_OK(...)                                             \
  do {                                                                      \
    [](const ::absl::Status& memostore_check_ok_condition) {                \
      if (ABSL_PREDICT_FALSE(!memostore_check_ok_condition.ok())) {         \
        ::memostore::internal::FatalStatus("Status not ok: " #__VA_ARGS__,  \
                                           memostore_check_ok_condition,    \
                                           __FILE__, __LINE__);             \
      }                                                                     \
    }(::memostore::GetStatus((__VA_ARGS__)));                               \
  } while (false)

#endif  // MEMOSTORE_UTIL_STATUS_H_
