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

#include "get_time.hpp"

#include "constants.hpp"

#if defined(_WIN32)
#ifndef _WINSOCKAPI_
#define _WINSOCKAPI_
#endif
#include <Windows.h>
#elif defined(__APPLE__) && defined(__MACH__)
#include <sys/time.h>
#else
#include <time.h>
#endif

namespace atomics { namespace internal {

#if defined(_WIN32)

uint64_t get_time_since_epoch_us() {
  _FILETIME ft;
  GetSystemTimeAsFileTime(&ft);
  uint64_t ns100 = (static_cast<uint64_t>(ft.dwHighDateTime) << 32 |
                    static_cast<uint64_t>(ft.dwLowDateTime)) -
                   116444736000000000LL; // 100 nanosecond increments between
                                         // Jan. 1, 1601 - Jan. 1, 1970
  return ns100 / 10;                     // 100 nanosecond increments to microseconds
}

#elif defined(__APPLE__) && defined(__MACH__)

uint64_t get_time_since_epoch_us() {
  struct timeval tv;
  gettimeofday(&tv, NULL);
  return static_cast<uint64_t>(tv.tv_sec) * MICROSECONDS_PER_SECOND +
         static_cast<uint64_t>(tv.tv_usec);
}

#else

uint64_t get_time_since_epoch_us() {
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * MICROSECONDS_PER_SECOND +
         static_cast<uint64_t>(ts.tv_nsec) / NANOSECONDS_PER_MICROSECOND;
}

#endif

}} // namespace atomics::internal
