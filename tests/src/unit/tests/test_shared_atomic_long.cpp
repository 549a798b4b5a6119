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

#include "atomic_long.hpp"

#include <uv.h>

#define NUM_SHARED_THREADS 4
#define NUM_SHARED_ITERATIONS 1000

using atomics::internal::SharedAtomicLong;

struct SharedThreadArgs {
  uv_thread_t thread;
  SharedAtomicLong::Ptr atomic_long;
};

// Records its own destruction in a flag owned by the test
class TrackedAtomicLong : public SharedAtomicLong {
public:
  TrackedAtomicLong(bool* is_destroyed)
      : is_destroyed_(is_destroyed) {}

  ~TrackedAtomicLong() { *is_destroyed_ = true; }

private:
  bool* is_destroyed_;
};

void shared_increment_thread(void* data) {
  SharedThreadArgs* args = static_cast<SharedThreadArgs*>(data);
  for (int i = 0; i < NUM_SHARED_ITERATIONS; ++i) {
    args->atomic_long->increment();
  }
  args->atomic_long.reset();
}

TEST(SharedAtomicLongUnitTest, CopiesShareValue) {
  SharedAtomicLong::Ptr first(new SharedAtomicLong(5));
  SharedAtomicLong::Ptr second(first);

  EXPECT_EQ(2, first->ref_count());
  EXPECT_TRUE(first == second);

  second->add(10);
  EXPECT_EQ(15, first->read());

  first->write(-3);
  EXPECT_EQ(-3, second->read());
}

TEST(SharedAtomicLongUnitTest, ReleaseLastReference) {
  bool is_destroyed = false;
  SharedAtomicLong::Ptr first(new TrackedAtomicLong(&is_destroyed));
  {
    SharedAtomicLong::Ptr second;
    second = first;
    EXPECT_EQ(2, first->ref_count());
  }
  EXPECT_EQ(1, first->ref_count());
  EXPECT_FALSE(is_destroyed);

  SharedAtomicLong::Ptr third(first);
  first.reset();
  EXPECT_FALSE(first);
  EXPECT_FALSE(is_destroyed);
  EXPECT_EQ(1, third->ref_count());

  third.reset();
  EXPECT_TRUE(is_destroyed);
}

TEST(SharedAtomicLongUnitTest, IncrementFromThreads) {
  bool is_destroyed = false;
  SharedAtomicLong::Ptr atomic_long(new TrackedAtomicLong(&is_destroyed));
  SharedThreadArgs args[NUM_SHARED_THREADS];

  for (int i = 0; i < NUM_SHARED_THREADS; ++i) {
    args[i].atomic_long = atomic_long;
    uv_thread_create(&args[i].thread, shared_increment_thread, &args[i]);
  }

  for (int i = 0; i < NUM_SHARED_THREADS; ++i) {
    uv_thread_join(&args[i].thread);
  }

  EXPECT_EQ(1, atomic_long->ref_count());
  EXPECT_EQ(static_cast<int64_t>(NUM_SHARED_THREADS * NUM_SHARED_ITERATIONS), atomic_long->read());
  EXPECT_FALSE(is_destroyed);

  atomic_long.reset();
  EXPECT_TRUE(is_destroyed);
}
