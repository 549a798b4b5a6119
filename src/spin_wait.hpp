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

#ifndef ATOMICS_INTERNAL_SPIN_WAIT_HPP
#define ATOMICS_INTERNAL_SPIN_WAIT_HPP

#include "constants.hpp"

namespace atomics { namespace internal {

/**
 * Backoff for compare-and-swap retry loops. The first failed attempts are
 * retried immediately; once the yield threshold is reached every further
 * attempt gives up the rest of the thread's time slice first.
 */
class SpinWait {
public:
  SpinWait()
      : count_(0) {}

  int count() const { return count_; }

  bool next_spin_will_yield() const { return count_ >= SPIN_WAIT_YIELD_THRESHOLD; }

  void spin_once();

  void reset() { count_ = 0; }

private:
  int count_;
};

}} // namespace atomics::internal

#endif
