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

#include "memostore/util/status.h"

#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "memostore/util/result.h"
#include "memostore/util/status_testutil.h"

namespace {

using ::memostore::IsOk;
using ::memostore::IsOkAndHolds;
using ::memostore::MaybeAnnotateStatus;
using ::memostore::Result;
using ::memostore::StatusIs;
using ::testing::HasSubstr;
using ::testing::Not;

TEST(StatusTest, MaybeAnnotateStatus) {
  EXPECT_THAT(MaybeAnnotateStatus(absl::OkStatus(), "Annotated"), IsOk());

  EXPECT_THAT(MaybeAnnotateStatus(absl::UnknownError("Boo"), "Annotated"),
              StatusIs(absl::StatusCode::kUnknown, "Annotated: Boo"));

  EXPECT_THAT(MaybeAnnotateStatus(absl::UnknownError(""), "Annotated"),
              StatusIs(absl::StatusCode::kUnknown, "Annotated"));

  EXPECT_THAT(MaybeAnnotateStatus(absl::UnknownError("Boo"), ""),
              StatusIs(absl::StatusCode::kUnknown, "Boo"));
}

TEST(StatusTest, MaybeAnnotateStatusPreservesPayload) {
  absl::Status status = absl::NotFoundError("missing");
  status.SetPayload("key", absl::Cord("value"));
  absl::Status annotated = MaybeAnnotateStatus(status, "lookup");
  EXPECT_EQ(absl::StatusCode::kNotFound, annotated.code());
  ASSERT_TRUE(annotated.GetPayload("key").has_value());
  EXPECT_EQ("value", std::string(*annotated.GetPayload("key")));
}

absl::Status ReturnIfError(absl::Status status, int* reached) {
  MEMOSTORE_RETURN_IF_ERROR(status);
  ++*reached;
  return absl::OkStatus();
}

absl::Status ReturnIfErrorAnnotated(absl::Status status) {
  MEMOSTORE_RETURN_IF_ERROR(status, MaybeAnnotateStatus(_, "In caller"));
  return absl::OkStatus();
}

TEST(StatusTest, ReturnIfError) {
  int reached = 0;
  EXPECT_THAT(ReturnIfError(absl::OkStatus(), &reached), IsOk());
  EXPECT_EQ(1, reached);
  EXPECT_THAT(ReturnIfError(absl::InternalError("failed"), &reached),
              StatusIs(absl::StatusCode::kInternal, "failed"));
  EXPECT_EQ(1, reached);
  EXPECT_THAT(ReturnIfErrorAnnotated(absl::InternalError("failed")),
              StatusIs(absl::StatusCode::kInternal, "In caller: failed"));
}

Result<int> Twice(Result<int> input) {
  MEMOSTORE_ASSIGN_OR_RETURN(int value, std::move(input));
  return value * 2;
}

TEST(StatusTest, AssignOrReturn) {
  EXPECT_THAT(Twice(21), IsOkAndHolds(42));
  EXPECT_THAT(Twice(absl::DataLossError("lost")),
              StatusIs(absl::StatusCode::kDataLoss, HasSubstr("lost")));
}

TEST(StatusTest, Matchers) {
  Result<int> ok_result = 7;
  Result<int> error_result = absl::AbortedError("aborted");
  EXPECT_THAT(ok_result, IsOkAndHolds(7));
  EXPECT_THAT(ok_result, Not(IsOkAndHolds(8)));
  EXPECT_THAT(error_result, Not(IsOk()));
  EXPECT_THAT(error_result.status(), StatusIs(absl::StatusCode::kAborted));
  MEMOSTORE_ASSERT_OK_AND_ASSIGN(int value, ok_result);
  EXPECT_EQ(7, value);
}

TEST(StatusDeathTest, CheckOk) {
  MEMOSTORE_CHECK_OK(absl::OkStatus());
  EXPECT_DEATH(MEMOSTORE_CHECK_OK(absl::InternalError("fatal")),
               "Status not ok");
}

}  // namespace
