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

#include "memostore/internal/testing/interleavings.h"

#include <stddef.h>

#include <optional>
#include <set>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace {

using ::memostore::internal_testing::ModelMutex;
using ::memostore::internal_testing::ModelRendezvous;
using ::memostore::internal_testing::ModelYield;
using ::memostore::internal_testing::TestAllInterleavings;
using ::testing::UnorderedElementsAre;

TEST(TestAllInterleavingsTest, NoOperations) {
  int initialized = 0;
  EXPECT_EQ(1, TestAllInterleavings([&] { ++initialized; }, [] {}));
  EXPECT_EQ(1, initialized);
}

TEST(TestAllInterleavingsTest, EveryStartOrder) {
  std::string trace;
  std::set<std::string> traces;
  EXPECT_EQ(6, TestAllInterleavings(
                   [&] { trace.clear(); }, [&] { traces.insert(trace); },
                   [&] { trace += "a"; }, [&] { trace += "b"; },
                   [&] { trace += "c"; }));
  EXPECT_THAT(traces, UnorderedElementsAre("abc", "acb", "bac", "bca", "cab",
                                           "cba"));
}

TEST(TestAllInterleavingsTest, YieldSplitsOperation) {
  std::string trace;
  std::set<std::string> traces;
  EXPECT_EQ(3, TestAllInterleavings(
                   [&] { trace.clear(); }, [&] { traces.insert(trace); },
                   [&] {
                     trace += "1";
                     ModelYield();
                     trace += "2";
                   },
                   [&] { trace += "x"; }));
  EXPECT_THAT(traces, UnorderedElementsAre("12x", "1x2", "x12"));
}

TEST(TestAllInterleavingsTest, EachScheduleRunsOnce) {
  std::string trace;
  std::multiset<std::string> traces;
  auto op = [&](char name) {
    return [&trace, name] {
      trace += name;
      ModelYield();
      trace += name;
    };
  };
  EXPECT_EQ(6, TestAllInterleavings([&] { trace.clear(); },
                                    [&] { traces.insert(trace); }, op('a'),
                                    op('b')));
  EXPECT_EQ(6, std::set<std::string>(traces.begin(), traces.end()).size());
}

TEST(TestAllInterleavingsTest, FindsLostUpdate) {
  int counter = 0;
  std::set<int> results;
  auto increment = [&] {
    int value = counter;
    ModelYield();
    counter = value + 1;
  };
  TestAllInterleavings([&] { counter = 0; },
                       [&] { results.insert(counter); }, increment,
                       increment);
  EXPECT_THAT(results, UnorderedElementsAre(1, 2));
}

TEST(ModelMutexTest, WriterLockExcludes) {
  ModelMutex mutex;
  int counter = 0;
  int inside = 0;
  auto increment = [&] {
    mutex.WriterLock();
    EXPECT_EQ(0, inside);
    ++inside;
    int value = counter;
    ModelYield();
    counter = value + 1;
    --inside;
    mutex.WriterUnlock();
  };
  size_t num_schedules = TestAllInterleavings(
      [&] { counter = 0; }, [&] { EXPECT_EQ(3, counter); }, increment,
      increment, increment);
  EXPECT_GT(num_schedules, 6);
}

TEST(ModelMutexTest, ReadersShare) {
  ModelMutex mutex;
  std::optional<ModelRendezvous> both_reading;
  auto read = [&] {
    mutex.ReaderLock();
    both_reading->Arrive();
    mutex.ReaderUnlock();
  };
  TestAllInterleavings([&] { both_reading.emplace(2); }, [] {}, read, read);
}

TEST(ModelMutexTest, WriterWaitsForReaders) {
  ModelMutex mutex;
  bool reading = false;
  TestAllInterleavings(
      [&] { reading = false; }, [] {},
      [&] {
        mutex.ReaderLock();
        reading = true;
        ModelYield();
        reading = false;
        mutex.ReaderUnlock();
      },
      [&] {
        mutex.WriterLock();
        EXPECT_FALSE(reading);
        mutex.WriterUnlock();
      });
}

TEST(ModelMutexTest, OutsideExploration) {
  ModelMutex mutex;
  mutex.WriterLock();
  mutex.WriterUnlock();
  mutex.ReaderLock();
  mutex.ReaderLock();
  mutex.ReaderUnlock();
  mutex.ReaderUnlock();
  mutex.Lock();
  mutex.Unlock();
}

TEST(ModelMutexDeathTest, WouldBlockOutsideExploration) {
  EXPECT_DEATH(
      {
        ModelMutex mutex;
        mutex.ReaderLock();
        mutex.WriterLock();
      },
      "would block");
}

TEST(ModelRendezvousDeathTest, DeadlockIsFatal) {
  // Both threads need the exclusive lock to reach the rendezvous.
  EXPECT_DEATH(
      {
        ModelMutex mutex;
        std::optional<ModelRendezvous> rendezvous;
        auto op = [&] {
          mutex.WriterLock();
          rendezvous->Arrive();
          mutex.WriterUnlock();
        };
        TestAllInterleavings([&] { rendezvous.emplace(2); }, [] {}, op, op);
      },
      "Deadlock");
}

}  // namespace
