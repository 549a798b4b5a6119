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

#ifndef ATOMICS_INTERNAL_ATOMIC_LONG_HPP
#define ATOMICS_INTERNAL_ATOMIC_LONG_HPP

#include "atomic.hpp"
#include "atomics.h"
#include "callback.hpp"
#include "external.hpp"
#include "macros.hpp"
#include "ref_counted.hpp"
#include "utils.hpp"

#include <stdint.h>
#include <string>

namespace atomics { namespace internal {

/**
 * A 64-bit signed integer that is only read and modified with atomic
 * operations. Every operation is linearizable and lock-free.
 *
 * The value lives inline in the object, so an AtomicLong is meant to be
 * embedded as a member and never copied: a copy would be a second, unrelated
 * slot. Copying is disabled; use SharedAtomicLong when several owners need the
 * same value.
 *
 * Arithmetic wraps on overflow (two's complement). The get_and_*() family
 * returns the value before the change, the *_and_get() family (and
 * increment(), decrement() and add()) the value after it.
 */
class AtomicLong {
public:
  typedef Callback<int64_t, int64_t> UpdateCallback;
  typedef BinaryCallback<int64_t, int64_t, int64_t> AccumulateCallback;

  explicit AtomicLong(int64_t value = 0);

  bool is_lock_free() const { return value_.is_lock_free(); }

  int64_t read() const { return value_.load(MEMORY_ORDER_ACQUIRE); }
  void write(int64_t value) { value_.store(value); }

  int64_t value() const { return read(); }
  void set_value(int64_t value) { write(value); }

  int64_t exchange(int64_t value) { return value_.exchange(value); }

  /**
   * Replaces the value with `value` if it's equal to `comparand`.
   *
   * @return The value observed by the attempt, whether or not it matched.
   */
  int64_t compare_exchange(int64_t value, int64_t comparand) {
    int64_t expected = comparand;
    value_.compare_exchange_strong(expected, value);
    return expected;
  }

  bool try_compare_exchange(int64_t value, int64_t comparand) {
    return value_.compare_exchange_strong(comparand, value);
  }

  int64_t increment() { return increment_and_get(); }
  int64_t decrement() { return decrement_and_get(); }
  int64_t add(int64_t delta) { return add_and_get(delta); }

  int64_t get_and_increment() { return value_.fetch_add(1); }
  int64_t get_and_decrement() { return value_.fetch_sub(1); }
  int64_t get_and_add(int64_t delta) { return value_.fetch_add(delta); }

  int64_t add_and_get(int64_t delta) { return wrapping_add(value_.fetch_add(delta), delta); }
  int64_t increment_and_get() { return wrapping_add(value_.fetch_add(1), 1); }
  int64_t decrement_and_get() { return wrapping_add(value_.fetch_sub(1), -1); }

  /**
   * Makes a single attempt to replace the value with `value` if `value` is
   * strictly greater. Fails without retrying if another thread changes the
   * value between the read and the compare-and-swap.
   */
  bool try_set_if_greater(int64_t value);
  bool try_set_if_less(int64_t value);

  /**
   * Raises the value to `value` unless it's already greater or equal,
   * retrying under contention.
   *
   * @return The value in effect when the call returns: either `value` or the
   * larger value that was already present.
   */
  int64_t set_if_greater(int64_t value);
  int64_t set_if_less(int64_t value);

  /**
   * Replaces the value with `callback(current)` in a compare-and-swap loop.
   * The callback may run several times, once per attempt, so it must not have
   * side effects that can't be repeated. Retries are unbounded: the loop is
   * lock-free, not wait-free.
   *
   * @param callback The transform. An empty callback is an error.
   * @param updated Optional. The value that was installed.
   * @return ATOMICS_OK or ATOMICS_ERROR_LIB_NULL_CALLBACK.
   */
  AtomicsError update(const UpdateCallback& callback, int64_t* updated);

  /**
   * A single attempt of update(). `original` and `updated` are filled in
   * whether or not the compare-and-swap succeeded, so the caller can retry.
   */
  AtomicsError try_update(const UpdateCallback& callback, int64_t* original, int64_t* updated,
                          bool* is_updated);

  /**
   * Same as update() using `callback(current, x)`.
   */
  AtomicsError accumulate(int64_t x, const AccumulateCallback& callback, int64_t* updated);

  std::string to_string() const;

  // `output` must hold at least ATOMICS_LONG_STRING_LENGTH characters
  void to_string(char* output) const;

private:
  template <class Step>
  int64_t compare_exchange_loop(const Step& step);

private:
  Atomic<int64_t> value_;

private:
  DISALLOW_COPY_AND_ASSIGN(AtomicLong);
};

/**
 * An AtomicLong shared by reference. All holders of a Ptr observe and modify
 * the same value; the instance is destroyed with the last reference.
 */
class SharedAtomicLong
    : public RefCounted<SharedAtomicLong>
    , public AtomicLong {
public:
  typedef SharedRefPtr<SharedAtomicLong> Ptr;

  explicit SharedAtomicLong(int64_t value = 0)
      : AtomicLong(value) {}

  virtual ~SharedAtomicLong() {}
};

}} // namespace atomics::internal

EXTERNAL_TYPE(atomics::internal::SharedAtomicLong, AtomicsLong)

#endif
