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

#ifndef ATOMICS_INTERNAL_CONSTANTS_HPP
#define ATOMICS_INTERNAL_CONSTANTS_HPP

#define NANOSECONDS_PER_MICROSECOND 1000LL
#define MICROSECONDS_PER_MILLISECOND 1000LL
#define MICROSECONDS_PER_SECOND 1000000LL

// Number of failed compare-and-swap attempts retried immediately before a
// retry loop starts yielding the processor between attempts.
#define SPIN_WAIT_YIELD_THRESHOLD 10

#endif
