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

#ifndef ATOMICS_INTERNAL_ATOMIC_BOOST_HPP
#define ATOMICS_INTERNAL_ATOMIC_BOOST_HPP

#include <boost/atomic.hpp>

namespace atomics { namespace internal {

// boost::memory_order is a scoped enumeration on newer versions of Boost
enum MemoryOrder {
  MEMORY_ORDER_RELAXED = static_cast<unsigned int>(boost::memory_order_relaxed),
  MEMORY_ORDER_ACQUIRE = static_cast<unsigned int>(boost::memory_order_acquire),
  MEMORY_ORDER_RELEASE = static_cast<unsigned int>(boost::memory_order_release),
  MEMORY_ORDER_ACQ_REL = static_cast<unsigned int>(boost::memory_order_acq_rel),
  MEMORY_ORDER_SEQ_CST = static_cast<unsigned int>(boost::memory_order_seq_cst)
};

inline boost::memory_order to_boost(MemoryOrder order) {
  return static_cast<boost::memory_order>(order);
}

template <class T>
class Atomic {
public:
  explicit Atomic(T value)
      : value_(value) {}

  void store(T value, MemoryOrder order = MEMORY_ORDER_SEQ_CST) {
    value_.store(value, to_boost(order));
  }

  T load(MemoryOrder order = MEMORY_ORDER_SEQ_CST) const { return value_.load(to_boost(order)); }

  T fetch_add(T value, MemoryOrder order = MEMORY_ORDER_SEQ_CST) {
    return value_.fetch_add(value, to_boost(order));
  }

  T fetch_sub(T value, MemoryOrder order = MEMORY_ORDER_SEQ_CST) {
    return value_.fetch_sub(value, to_boost(order));
  }

  T exchange(T value, MemoryOrder order = MEMORY_ORDER_SEQ_CST) {
    return value_.exchange(value, to_boost(order));
  }

  // On failure `expected` is updated with the value that was found
  bool compare_exchange_strong(T& expected, T desired, MemoryOrder order = MEMORY_ORDER_SEQ_CST) {
    return value_.compare_exchange_strong(expected, desired, to_boost(order));
  }

  // Without native 64-bit atomics boost falls back to a lock pool
  bool is_lock_free() const { return value_.is_lock_free(); }

private:
  boost::atomic<T> value_;
};

inline void atomic_thread_fence(MemoryOrder order) { boost::atomic_thread_fence(to_boost(order)); }

}} // namespace atomics::internal

#endif
