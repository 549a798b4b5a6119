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

#include "unit.hpp"

#include "spin_wait.hpp"

using atomics::internal::SpinWait;

class SpinWaitUnitTest : public Unit {};

TEST_F(SpinWaitUnitTest, YieldsAfterThreshold) {
  SpinWait spin;
  EXPECT_EQ(0, spin.count());

  for (int i = 0; i < SPIN_WAIT_YIELD_THRESHOLD; ++i) {
    EXPECT_FALSE(spin.next_spin_will_yield());
    spin.spin_once();
  }
  EXPECT_EQ(SPIN_WAIT_YIELD_THRESHOLD, spin.count());
  EXPECT_TRUE(spin.next_spin_will_yield());

  spin.spin_once();
  EXPECT_EQ(SPIN_WAIT_YIELD_THRESHOLD + 1, spin.count());
  EXPECT_TRUE(spin.next_spin_will_yield());
}

TEST_F(SpinWaitUnitTest, Reset) {
  SpinWait spin;
  for (int i = 0; i < 2 * SPIN_WAIT_YIELD_THRESHOLD; ++i) {
    spin.spin_once();
  }
  EXPECT_TRUE(spin.next_spin_will_yield());

  spin.reset();
  EXPECT_EQ(0, spin.count());
  EXPECT_FALSE(spin.next_spin_will_yield());
}

TEST_F(SpinWaitUnitTest, LogsFirstYield) {
  add_logging_critera("yielding between further attempts", ATOMICS_LOG_TRACE);

  SpinWait spin;
  for (int i = 0; i < 3 * SPIN_WAIT_YIELD_THRESHOLD; ++i) {
    spin.spin_once();
  }
  EXPECT_EQ(1, logging_criteria_count());

  // A reset starts a new episode that logs again
  reset_logging_criteria();
  add_logging_critera("yielding between further attempts", ATOMICS_LOG_TRACE);
  spin.reset();
  for (int i = 0; i <= SPIN_WAIT_YIELD_THRESHOLD; ++i) {
    spin.spin_once();
  }
  EXPECT_EQ(1, logging_criteria_count());
}
