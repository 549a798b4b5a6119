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

#include <gtest/gtest.h>

#include "atomic.hpp"

#include <limits>
#include <stdint.h>

using atomics::internal::Atomic;
using atomics::internal::atomic_thread_fence;
using atomics::internal::MEMORY_ORDER_ACQ_REL;
using atomics::internal::MEMORY_ORDER_ACQUIRE;
using atomics::internal::MEMORY_ORDER_RELAXED;
using atomics::internal::MEMORY_ORDER_RELEASE;
using atomics::internal::MEMORY_ORDER_SEQ_CST;

template <class T>
void test_atomic_integer() {
  const T max_value = std::numeric_limits<T>::max();
  const T min_value = std::numeric_limits<T>::min();

  const T zero = static_cast<T>(0);
  const T one = static_cast<T>(1);

  Atomic<T> i(zero);
  EXPECT_EQ(zero, i.load());

  EXPECT_EQ(zero, i.exchange(one));
  EXPECT_EQ(one, i.load());

  T expected = one;
  EXPECT_TRUE(i.compare_exchange_strong(expected, zero));
  EXPECT_EQ(one, expected);
  EXPECT_EQ(zero, i.load());

  // A failed exchange reports the value it found
  expected = one;
  EXPECT_FALSE(i.compare_exchange_strong(expected, max_value));
  EXPECT_EQ(zero, expected);
  EXPECT_EQ(zero, i.load());

  i.store(one);

  EXPECT_EQ(one, i.fetch_add(one));
  EXPECT_EQ(static_cast<T>(2), i.fetch_sub(one));
  EXPECT_EQ(one, i.load());

  // Arithmetic wraps at the boundaries
  i.store(max_value);
  EXPECT_EQ(max_value, i.fetch_add(one));
  EXPECT_EQ(min_value, i.load());
  EXPECT_EQ(min_value, i.fetch_sub(one));
  EXPECT_EQ(max_value, i.load());
}

TEST(AtomicUnitTest, Integers) {
  test_atomic_integer<int32_t>();
  test_atomic_integer<int64_t>();
  test_atomic_integer<uint64_t>();
}

TEST(AtomicUnitTest, ExplicitMemoryOrders) {
  Atomic<int64_t> i(0);

  i.store(5, MEMORY_ORDER_RELEASE);
  EXPECT_EQ(5, i.load(MEMORY_ORDER_ACQUIRE));
  EXPECT_EQ(5, i.load(MEMORY_ORDER_RELAXED));

  EXPECT_EQ(5, i.fetch_add(2, MEMORY_ORDER_RELAXED));
  EXPECT_EQ(7, i.fetch_sub(3, MEMORY_ORDER_ACQ_REL));
  EXPECT_EQ(4, i.exchange(9, MEMORY_ORDER_SEQ_CST));

  int64_t expected = 9;
  EXPECT_TRUE(i.compare_exchange_strong(expected, 11, MEMORY_ORDER_ACQ_REL));
  atomic_thread_fence(MEMORY_ORDER_SEQ_CST);
  EXPECT_EQ(11, i.load());
}

#if defined(__x86_64__) || defined(_M_X64) || defined(__aarch64__)
TEST(AtomicUnitTest, Int64IsLockFree) {
  Atomic<int64_t> i(0);
  EXPECT_TRUE(i.is_lock_free());
}
#endif

TEST(AtomicUnitTest, Boolean) {
  Atomic<bool> b(false);
  EXPECT_FALSE(b.load());

  EXPECT_FALSE(b.exchange(true));
  EXPECT_TRUE(b.load());

  bool expected = false;
  EXPECT_FALSE(b.compare_exchange_strong(expected, false));
  EXPECT_TRUE(expected);
  EXPECT_TRUE(b.compare_exchange_strong(expected, false));
  EXPECT_FALSE(b.load());
}
