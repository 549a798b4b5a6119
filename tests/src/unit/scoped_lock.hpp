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

#ifndef ATOMICS_TEST_SCOPED_LOCK_HPP
#define ATOMICS_TEST_SCOPED_LOCK_HPP

#include "macros.hpp"

#include <assert.h>
#include <uv.h>

namespace test {

class Mutex {
public:
  typedef uv_mutex_t Type;
  Mutex(uv_mutex_t* m)
      : mutex_(m) {}
  void lock() { uv_mutex_lock(mutex_); }
  void unlock() { uv_mutex_unlock(mutex_); }

private:
  uv_mutex_t* mutex_;
};

template <class Lock>
class ScopedLock {
public:
  ScopedLock(typename Lock::Type* l)
      : lock_(l) {
    lock_.lock();
  }

  ~ScopedLock() { lock_.unlock(); }

private:
  Lock lock_;

private:
  DISALLOW_COPY_AND_ASSIGN(ScopedLock);
};

typedef ScopedLock<Mutex> ScopedMutex;

} // namespace test

#endif
