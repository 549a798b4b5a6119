/*
  Copyright (c) DataStax, Inc.

  Licensed under the Apache License, Version 2.0 (the "License");
  you may not use this file except in compliance with the License.
  You may obtain a copy of the License at

  http://www.apache.org/licenses/LICENSE-2.0

  Unless required by applicable law or agreed to in writing, software
  distributed under the License is distributed on an "AS IS" BASIS,
  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
  See the License for the specific language governing permissions and
  limitations under the License.
*/

#include "spin_wait.hpp"

#include "logger.hpp"
#include "utils.hpp"

#include <limits>

namespace atomics { namespace internal {

void SpinWait::spin_once() {
  if (next_spin_will_yield()) {
    if (count_ == SPIN_WAIT_YIELD_THRESHOLD) {
      LOG_TRACE("Compare-and-swap failed %d times, yielding between further attempts", count_);
    }
    thread_yield();
  }
  if (count_ < std::numeric_limits<int>::max()) {
    ++count_;
  }
}

}} // namespace atomics::internal
