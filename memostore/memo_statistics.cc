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

#include "memostore/memo_statistics.h"

#include <ostream>

namespace memostore {

std::ostream& operator<<(std::ostream& os, const MemoStatistics& s) {
  return os << "{hits=" << s.hits << ", coalesced=" << s.coalesced
            << ", computations=" << s.computations
            << ", failures=" << s.failures << "}";
}

}  // namespace memostore
