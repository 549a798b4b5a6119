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

#include "atomic_long.hpp"

#include "logger.hpp"
#include "spin_wait.hpp"

#include <inttypes.h>
#include <stdio.h>

using namespace atomics::internal;

extern "C" {

AtomicsLong* atomics_long_new(atomics_int64_t initial_value) {
  SharedAtomicLong* atomic_long = new SharedAtomicLong(initial_value);
  atomic_long->inc_ref();
  return AtomicsLong::to(atomic_long);
}

void atomics_long_free(AtomicsLong* atomic_long) { atomic_long->dec_ref(); }

atomics_bool_t atomics_long_is_lock_free(const AtomicsLong* atomic_long) {
  return atomic_long->is_lock_free() ? atomics_true : atomics_false;
}

atomics_int64_t atomics_long_read(const AtomicsLong* atomic_long) { return atomic_long->read(); }

void atomics_long_write(AtomicsLong* atomic_long, atomics_int64_t value) {
  atomic_long->write(value);
}

atomics_int64_t atomics_long_exchange(AtomicsLong* atomic_long, atomics_int64_t value) {
  return atomic_long->exchange(value);
}

atomics_int64_t atomics_long_compare_exchange(AtomicsLong* atomic_long, atomics_int64_t value,
                                              atomics_int64_t comparand) {
  return atomic_long->compare_exchange(value, comparand);
}

atomics_bool_t atomics_long_try_compare_exchange(AtomicsLong* atomic_long, atomics_int64_t value,
                                                 atomics_int64_t comparand) {
  return atomic_long->try_compare_exchange(value, comparand) ? atomics_true : atomics_false;
}

atomics_int64_t atomics_long_increment(AtomicsLong* atomic_long) {
  return atomic_long->increment();
}

atomics_int64_t atomics_long_decrement(AtomicsLong* atomic_long) {
  return atomic_long->decrement();
}

atomics_int64_t atomics_long_add(AtomicsLong* atomic_long, atomics_int64_t delta) {
  return atomic_long->add(delta);
}

atomics_int64_t atomics_long_get_and_increment(AtomicsLong* atomic_long) {
  return atomic_long->get_and_increment();
}

atomics_int64_t atomics_long_get_and_decrement(AtomicsLong* atomic_long) {
  return atomic_long->get_and_decrement();
}

atomics_int64_t atomics_long_get_and_add(AtomicsLong* atomic_long, atomics_int64_t delta) {
  return atomic_long->get_and_add(delta);
}

atomics_int64_t atomics_long_add_and_get(AtomicsLong* atomic_long, atomics_int64_t delta) {
  return atomic_long->add_and_get(delta);
}

atomics_int64_t atomics_long_increment_and_get(AtomicsLong* atomic_long) {
  return atomic_long->increment_and_get();
}

atomics_int64_t atomics_long_decrement_and_get(AtomicsLong* atomic_long) {
  return atomic_long->decrement_and_get();
}

atomics_bool_t atomics_long_try_set_if_greater(AtomicsLong* atomic_long, atomics_int64_t value) {
  return atomic_long->try_set_if_greater(value) ? atomics_true : atomics_false;
}

atomics_bool_t atomics_long_try_set_if_less(AtomicsLong* atomic_long, atomics_int64_t value) {
  return atomic_long->try_set_if_less(value) ? atomics_true : atomics_false;
}

atomics_int64_t atomics_long_set_if_greater(AtomicsLong* atomic_long, atomics_int64_t value) {
  return atomic_long->set_if_greater(value);
}

atomics_int64_t atomics_long_set_if_less(AtomicsLong* atomic_long, atomics_int64_t value) {
  return atomic_long->set_if_less(value);
}

AtomicsError atomics_long_update(AtomicsLong* atomic_long, AtomicsLongUpdateCallback callback,
                                 void* data, atomics_int64_t* output) {
  if (callback == NULL) {
    LOG_ERROR("Update callback is NULL");
    return ATOMICS_ERROR_LIB_NULL_CALLBACK;
  }
  if (output == NULL) {
    LOG_ERROR("Output parameter for update is NULL");
    return ATOMICS_ERROR_LIB_BAD_PARAMS;
  }
  int64_t updated = 0;
  AtomicsError rc = atomic_long->update(bind_callback(callback, data), &updated);
  if (rc == ATOMICS_OK) {
    *output = updated;
  }
  return rc;
}

AtomicsError atomics_long_try_update(AtomicsLong* atomic_long, AtomicsLongUpdateCallback callback,
                                     void* data, atomics_int64_t* original,
                                     atomics_int64_t* updated, atomics_bool_t* is_updated) {
  if (callback == NULL) {
    LOG_ERROR("Update callback is NULL");
    return ATOMICS_ERROR_LIB_NULL_CALLBACK;
  }
  if (original == NULL || updated == NULL || is_updated == NULL) {
    LOG_ERROR("Output parameter for try update is NULL");
    return ATOMICS_ERROR_LIB_BAD_PARAMS;
  }
  int64_t observed = 0;
  int64_t computed = 0;
  bool success = false;
  AtomicsError rc =
      atomic_long->try_update(bind_callback(callback, data), &observed, &computed, &success);
  if (rc == ATOMICS_OK) {
    *original = observed;
    *updated = computed;
    *is_updated = success ? atomics_true : atomics_false;
  }
  return rc;
}

AtomicsError atomics_long_accumulate(AtomicsLong* atomic_long, atomics_int64_t x,
                                     AtomicsLongAccumulateCallback callback, void* data,
                                     atomics_int64_t* output) {
  if (callback == NULL) {
    LOG_ERROR("Accumulate callback is NULL");
    return ATOMICS_ERROR_LIB_NULL_CALLBACK;
  }
  if (output == NULL) {
    LOG_ERROR("Output parameter for accumulate is NULL");
    return ATOMICS_ERROR_LIB_BAD_PARAMS;
  }
  int64_t updated = 0;
  AtomicsError rc = atomic_long->accumulate(x, bind_callback(callback, data), &updated);
  if (rc == ATOMICS_OK) {
    *output = updated;
  }
  return rc;
}

void atomics_long_string(const AtomicsLong* atomic_long, char* output) {
  atomic_long->to_string(output);
}

} // extern "C"

namespace {

// A step decides the next value of one compare-and-swap attempt. Returning
// false ends the loop without writing because the value is already where the
// operation wants it.

class SetIfGreaterStep {
public:
  explicit SetIfGreaterStep(int64_t value)
      : value_(value) {}

  bool next(int64_t current, int64_t* result) const {
    if (value_ <= current) return false;
    *result = value_;
    return true;
  }

private:
  int64_t value_;
};

class SetIfLessStep {
public:
  explicit SetIfLessStep(int64_t value)
      : value_(value) {}

  bool next(int64_t current, int64_t* result) const {
    if (value_ >= current) return false;
    *result = value_;
    return true;
  }

private:
  int64_t value_;
};

class UpdateStep {
public:
  explicit UpdateStep(const AtomicLong::UpdateCallback& callback)
      : callback_(callback) {}

  bool next(int64_t current, int64_t* result) const {
    *result = callback_(current);
    return true;
  }

private:
  const AtomicLong::UpdateCallback& callback_;
};

class AccumulateStep {
public:
  AccumulateStep(int64_t x, const AtomicLong::AccumulateCallback& callback)
      : x_(x)
      , callback_(callback) {}

  bool next(int64_t current, int64_t* result) const {
    *result = callback_(current, x_);
    return true;
  }

private:
  int64_t x_;
  const AtomicLong::AccumulateCallback& callback_;
};

} // namespace

template <class Step>
int64_t AtomicLong::compare_exchange_loop(const Step& step) {
  SpinWait spin;
  while (true) {
    int64_t current = value_.load(MEMORY_ORDER_ACQUIRE);
    int64_t next;
    if (!step.next(current, &next)) {
      return current;
    }
    if (value_.compare_exchange_strong(current, next)) {
      return next;
    }
    spin.spin_once();
  }
}

AtomicLong::AtomicLong(int64_t value)
    : value_(value) {
  // Logged once per process
  static Atomic<bool> is_warning_logged(false);
  if (!value_.is_lock_free() && !is_warning_logged.exchange(true)) {
    LOG_WARN("64-bit atomics are not lock-free on this platform; "
             "operations will use an internal lock");
  }
}

bool AtomicLong::try_set_if_greater(int64_t value) {
  int64_t current = value_.load(MEMORY_ORDER_ACQUIRE);
  if (value <= current) return false;
  return value_.compare_exchange_strong(current, value);
}

bool AtomicLong::try_set_if_less(int64_t value) {
  int64_t current = value_.load(MEMORY_ORDER_ACQUIRE);
  if (value >= current) return false;
  return value_.compare_exchange_strong(current, value);
}

int64_t AtomicLong::set_if_greater(int64_t value) {
  return compare_exchange_loop(SetIfGreaterStep(value));
}

int64_t AtomicLong::set_if_less(int64_t value) {
  return compare_exchange_loop(SetIfLessStep(value));
}

AtomicsError AtomicLong::update(const UpdateCallback& callback, int64_t* updated) {
  if (!callback) {
    LOG_ERROR("Unable to update atomic long: no update callback");
    return ATOMICS_ERROR_LIB_NULL_CALLBACK;
  }
  int64_t result = compare_exchange_loop(UpdateStep(callback));
  if (updated != NULL) {
    *updated = result;
  }
  return ATOMICS_OK;
}

AtomicsError AtomicLong::try_update(const UpdateCallback& callback, int64_t* original,
                                    int64_t* updated, bool* is_updated) {
  if (!callback) {
    LOG_ERROR("Unable to update atomic long: no update callback");
    return ATOMICS_ERROR_LIB_NULL_CALLBACK;
  }
  int64_t current = value_.load(MEMORY_ORDER_ACQUIRE);
  int64_t next = callback(current);
  if (original != NULL) {
    *original = current;
  }
  if (updated != NULL) {
    *updated = next;
  }
  bool success = value_.compare_exchange_strong(current, next);
  if (is_updated != NULL) {
    *is_updated = success;
  }
  return ATOMICS_OK;
}

AtomicsError AtomicLong::accumulate(int64_t x, const AccumulateCallback& callback,
                                    int64_t* updated) {
  if (!callback) {
    LOG_ERROR("Unable to accumulate atomic long: no accumulate callback");
    return ATOMICS_ERROR_LIB_NULL_CALLBACK;
  }
  int64_t result = compare_exchange_loop(AccumulateStep(x, callback));
  if (updated != NULL) {
    *updated = result;
  }
  return ATOMICS_OK;
}

std::string AtomicLong::to_string() const {
  char buf[ATOMICS_LONG_STRING_LENGTH];
  to_string(buf);
  return std::string(buf);
}

void AtomicLong::to_string(char* output) const {
  snprintf(output, ATOMICS_LONG_STRING_LENGTH, "%" PRId64, read());
}
