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

#ifndef MEMOSTORE_UTIL_STATUS_TESTUTIL_H_
#define MEMOSTORE_UTIL_STATUS_TESTUTIL_H_

/// \file
/// Implements GMock matchers for absl::Status and Result.
/// For example, to test an Ok result, perhaps with a value, use:
///
///   EXPECT_THAT(DoSomething(), ::memostore::IsOk());
///   EXPECT_THAT(DoSomething(), ::memostore::IsOkAndHolds(7));
///
/// To test an error expectation, use:
///
///   EXPECT_THAT(DoSomething(),
///               ::memostore::StatusIs(absl::StatusCode::kInternal));
///   EXPECT_THAT(DoSomething(),
///               ::memostore::StatusIs(absl::StatusCode::kInternal,
///                                     ::testing::HasSubstr("foo")));

#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "memostore/util/result.h"
#include "memostore/util/status.h"

namespace memostore {
namespace internal_status {

// Monomorphic implementation of matcher IsOkAndHolds(m).
// StatusType is a const reference to a Result<T>.
template <typename StatusType>
class IsOkAndHoldsMatcherImpl : public ::testing::MatcherInterface<StatusType> {
 public:
  using value_type = typename std::remove_cv_t<
      std::remove_reference_t<StatusType>>::value_type;

  template <typename InnerMatcher>
  explicit IsOkAndHoldsMatcherImpl(InnerMatcher&& inner_matcher)
      : inner_matcher_(::testing::SafeMatcherCast<const value_type&>(
            std::forward<InnerMatcher>(inner_matcher))) {}

  void DescribeTo(std::ostream* os) const override {
    *os << "is OK and has a value that ";
    inner_matcher_.DescribeTo(os);
  }
  void DescribeNegationTo(std::ostream* os) const override {
    *os << "isn't OK or has a value that ";
    inner_matcher_.DescribeNegationTo(os);
  }
  bool MatchAndExplain(
      StatusType actual_value,
      ::testing::MatchResultListener* result_listener) const override {
    const absl::Status& status = ::memostore::GetStatus(actual_value);
    if (!status.ok()) {
      *result_listener << "whose status is " << status;
      return false;
    }
    ::testing::StringMatchResultListener inner_listener;
    if (!inner_matcher_.MatchAndExplain(*actual_value, &inner_listener)) {
      *result_listener << "whose value "
                       << ::testing::PrintToString(*actual_value)
                       << " doesn't match";
      if (!inner_listener.str().empty()) {
        *result_listener << ", " << inner_listener.str();
      }
      return false;
    }
    return true;
  }

 private:
  const ::testing::Matcher<const value_type&> inner_matcher_;
};

// Implements IsOkAndHolds(m) as a polymorphic matcher.
template <typename InnerMatcher>
class IsOkAndHoldsMatcher {
 public:
  explicit IsOkAndHoldsMatcher(InnerMatcher inner_matcher)
      : inner_matcher_(std::move(inner_matcher)) {}

  template <typename StatusType>
  operator ::testing::Matcher<StatusType>() const {  // NOLINT
    return ::testing::Matcher<StatusType>(
        new IsOkAndHoldsMatcherImpl<const StatusType&>(inner_matcher_));
  }

 private:
  const InnerMatcher inner_matcher_;
};

// Implements IsOk() as a polymorphic matcher.
template <typename StatusType>
class IsOkMatcherImpl : public ::testing::MatcherInterface<StatusType> {
 public:
  void DescribeTo(std::ostream* os) const override { *os << "is OK"; }
  void DescribeNegationTo(std::ostream* os) const override {
    *os << "is not OK";
  }
  bool MatchAndExplain(
      StatusType actual_value,
      ::testing::MatchResultListener* result_listener) const override {
    const absl::Status& status = ::memostore::GetStatus(actual_value);
    if (!status.ok()) *result_listener << "whose status is " << status;
    return status.ok();
  }
};

class IsOkMatcher {
 public:
  template <typename StatusType>
  operator ::testing::Matcher<StatusType>() const {  // NOLINT
    return ::testing::Matcher<StatusType>(
        new IsOkMatcherImpl<const StatusType&>());
  }
};

// Implements StatusIs(code, message) for absl::Status and Result<T>.
template <typename StatusType>
class StatusIsMatcherImpl : public ::testing::MatcherInterface<StatusType> {
 public:
  StatusIsMatcherImpl(::testing::Matcher<absl::StatusCode> code_matcher,
                      ::testing::Matcher<const std::string&> message_matcher)
      : code_matcher_(std::move(code_matcher)),
        message_matcher_(std::move(message_matcher)) {}

  void DescribeTo(std::ostream* os) const override {
    *os << "has a status code that ";
    code_matcher_.DescribeTo(os);
    *os << ", and has an error message that ";
    message_matcher_.DescribeTo(os);
  }
  void DescribeNegationTo(std::ostream* os) const override {
    *os << "has a status code that ";
    code_matcher_.DescribeNegationTo(os);
    *os << ", or has an error message that ";
    message_matcher_.DescribeNegationTo(os);
  }
  bool MatchAndExplain(
      StatusType actual_value,
      ::testing::MatchResultListener* result_listener) const override {
    const absl::Status& status = ::memostore::GetStatus(actual_value);
    if (!code_matcher_.Matches(status.code())) {
      *result_listener << "whose status code "
                       << absl::StatusCodeToString(status.code())
                       << " doesn't match";
      return false;
    }
    if (!message_matcher_.Matches(std::string(status.message()))) {
      *result_listener << "whose error message is wrong";
      return false;
    }
    return true;
  }

 private:
  const ::testing::Matcher<absl::StatusCode> code_matcher_;
  const ::testing::Matcher<const std::string&> message_matcher_;
};

class StatusIsMatcher {
 public:
  StatusIsMatcher(::testing::Matcher<absl::StatusCode> code_matcher,
                  ::testing::Matcher<const std::string&> message_matcher)
      : code_matcher_(std::move(code_matcher)),
        message_matcher_(std::move(message_matcher)) {}

  template <typename StatusType>
  operator ::testing::Matcher<StatusType>() const {  // NOLINT
    return ::testing::Matcher<StatusType>(
        new StatusIsMatcherImpl<const StatusType&>(code_matcher_,
                                                   message_matcher_));
  }

 private:
  const ::testing::Matcher<absl::StatusCode> code_matcher_;
  const ::testing::Matcher<const std::string&> message_matcher_;
};

}  // namespace internal_status

// Returns a gMock matcher that matches an OK Status/Result.
inline internal_status::IsOkMatcher IsOk() {
  return internal_status::IsOkMatcher();
}

// Returns a gMock matcher that matches an OK Result whose value matches the
// inner matcher.
template <typename InnerMatcher>
internal_status::IsOkAndHoldsMatcher<std::decay_t<InnerMatcher>> IsOkAndHolds(
    InnerMatcher&& inner_matcher) {
  return internal_status::IsOkAndHoldsMatcher<std::decay_t<InnerMatcher>>(
      std::forward<InnerMatcher>(inner_matcher));
}

// Returns a matcher that matches a Status/Result whose code matches
// `code_matcher` and whose error message matches `message_matcher`.
template <typename CodeMatcher, typename MessageMatcher>
internal_status::StatusIsMatcher StatusIs(CodeMatcher code_matcher,
                                          MessageMatcher message_matcher) {
  return internal_status::StatusIsMatcher(std::move(code_matcher),
                                          std::move(message_matcher));
}

// Returns a matcher that matches a Status/Result whose code matches
// `code_matcher`.
template <typename CodeMatcher>
internal_status::StatusIsMatcher StatusIs(CodeMatcher code_matcher) {
  return internal_status::StatusIsMatcher(std::move(code_matcher),
                                          ::testing::_);
}

}  // namespace memostore

/// EXPECT assertion that the argument, when converted to an `absl::Status` via
/// `memostore::GetStatus`, has a code of `absl::StatusCode::kOk`.
#define MEMOSTORE_EXPECT_OK(expr) EXPECT_THAT(expr, ::memostore::IsOk())

/// Same as `MEMOSTORE_EXPECT_OK`, but returns in the case of an error.
#define MEMOSTORE_ASSERT_OK(expr) ASSERT_THAT(expr, ::memostore::IsOk())

/// ASSERTs that `expr` is a `memostore::Result` with a value, and assigns the
/// value to `decl`.
///
///     MEMOSTORE_ASSERT_OK_AND_ASSIGN(int x, GetResult());
#define MEMOSTORE_ASSERT_OK_AND_ASSIGN(decl, expr)                      \
  MEMOSTORE_ASSIGN_OR_RETURN(decl, expr,                                \
                             ([&] { FAIL() << #expr << ": " << _; })()) \
  /**/

#endif  // MEMOSTORE_UTIL_STATUS_TESTUTIL_H_
