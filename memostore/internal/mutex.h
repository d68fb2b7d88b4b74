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

#ifndef MEMOSTORE_INTERNAL_MUTEX_H_
#define MEMOSTORE_INTERNAL_MUTEX_H_

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

namespace memostore {
namespace internal {

/// Holds a shared (reader) lock on `MutexType` for the lifetime of the
/// object.
///
/// `MutexType` must provide `ReaderLock()` and `ReaderUnlock()`, as
/// `absl::Mutex` does.  Unlike `absl::ReaderMutexLock` this is not tied to
/// `absl::Mutex`, so that lock-striped containers may be instantiated with an
/// alternative mutex in tests.
template <typename MutexType>
class ABSL_SCOPED_LOCKABLE ScopedReaderLock {
 public:
  explicit ScopedReaderLock(MutexType& mutex) ABSL_SHARED_LOCK_FUNCTION(mutex)
      : mutex_(mutex) {
    mutex_.ReaderLock();
  }
  ~ScopedReaderLock() ABSL_UNLOCK_FUNCTION() { mutex_.ReaderUnlock(); }

  ScopedReaderLock(const ScopedReaderLock&) = delete;
  ScopedReaderLock& operator=(const ScopedReaderLock&) = delete;

 private:
  MutexType& mutex_;
};

/// Holds an exclusive (writer) lock on `MutexType` for the lifetime of the
/// object.
///
/// `MutexType` must provide `WriterLock()` and `WriterUnlock()`.
template <typename MutexType>
class ABSL_SCOPED_LOCKABLE ScopedWriterLock {
 public:
  explicit ScopedWriterLock(MutexType& mutex)
      ABSL_EXCLUSIVE_LOCK_FUNCTION(mutex)
      : mutex_(mutex) {
    mutex_.WriterLock();
  }
  ~ScopedWriterLock() ABSL_UNLOCK_FUNCTION() { mutex_.WriterUnlock(); }

  ScopedWriterLock(const ScopedWriterLock&) = delete;
  ScopedWriterLock& operator=(const ScopedWriterLock&) = delete;

 private:
  MutexType& mutex_;
};

}  // namespace internal
}  // namespace memostore

#endif  // MEMOSTORE_INTERNAL_MUTEX_H_
