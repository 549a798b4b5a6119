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

#include "callback.hpp"

#include <stdint.h>

using atomics::internal::BinaryCallback;
using atomics::internal::bind_callback;
using atomics::internal::Callback;

class Scaler {
public:
  Scaler(int64_t factor)
      : factor_(factor) {}

  int64_t scale(int64_t value) { return value * factor_; }
  int64_t scale_and_add(int64_t value, int64_t x) { return value * factor_ + x; }

private:
  int64_t factor_;
};

static int64_t negate(int64_t value) { return -value; }

static int64_t subtract(int64_t value, int64_t x) { return value - x; }

static int64_t clamp(int64_t value, int64_t* limit) { return value > *limit ? *limit : value; }

static int64_t clamp_sum(int64_t value, int64_t x, int64_t* limit) {
  return value + x > *limit ? *limit : value + x;
}

TEST(CallbackUnitTest, Empty) {
  Callback<int64_t, int64_t> callback;
  EXPECT_FALSE(callback);

  BinaryCallback<int64_t, int64_t, int64_t> binary_callback;
  EXPECT_FALSE(binary_callback);
}

TEST(CallbackUnitTest, Function) {
  Callback<int64_t, int64_t> callback(bind_callback(negate));
  EXPECT_TRUE(callback);
  EXPECT_EQ(-3, callback(3));

  BinaryCallback<int64_t, int64_t, int64_t> binary_callback(bind_callback(subtract));
  EXPECT_EQ(7, binary_callback(10, 3));
}

TEST(CallbackUnitTest, Member) {
  Scaler scaler(3);

  Callback<int64_t, int64_t> callback(bind_callback(&Scaler::scale, &scaler));
  EXPECT_EQ(12, callback(4));

  BinaryCallback<int64_t, int64_t, int64_t> binary_callback(
      bind_callback(&Scaler::scale_and_add, &scaler));
  EXPECT_EQ(13, binary_callback(4, 1));
}

TEST(CallbackUnitTest, FunctionWithData) {
  int64_t limit = 10;

  Callback<int64_t, int64_t> callback(bind_callback(clamp, &limit));
  EXPECT_EQ(5, callback(5));
  EXPECT_EQ(10, callback(50));

  limit = 20;
  EXPECT_EQ(20, callback(50));

  BinaryCallback<int64_t, int64_t, int64_t> binary_callback(bind_callback(clamp_sum, &limit));
  EXPECT_EQ(15, binary_callback(5, 10));
  EXPECT_EQ(20, binary_callback(15, 10));
}

TEST(CallbackUnitTest, CopyAndAssign) {
  Scaler scaler(2);
  Callback<int64_t, int64_t> callback(bind_callback(&Scaler::scale, &scaler));

  Callback<int64_t, int64_t> copy(callback);
  EXPECT_EQ(8, copy(4));

  Callback<int64_t, int64_t> assigned;
  assigned = callback;
  EXPECT_EQ(10, assigned(5));

  assigned = Callback<int64_t, int64_t>();
  EXPECT_FALSE(assigned);
  EXPECT_TRUE(callback);

  BinaryCallback<int64_t, int64_t, int64_t> binary_callback(bind_callback(subtract));
  BinaryCallback<int64_t, int64_t, int64_t> binary_copy;
  binary_copy = binary_callback;
  EXPECT_EQ(1, binary_copy(3, 2));
}
