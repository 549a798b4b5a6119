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

#include "atomics.h"

extern "C" {

const char* atomics_error_desc(AtomicsError error) {
  switch (error) {
#define XX(source, _, code, desc)   \
  case ATOMICS_ERROR(source, code): \
    return desc;
    ATOMICS_ERROR_MAPPING(XX)
#undef XX
    default:
      return "";
  }
}

const char* atomics_log_level_string(AtomicsLogLevel log_level) {
  switch (log_level) {
#define XX(log_level, desc) \
  case log_level:           \
    return desc;
    ATOMICS_LOG_LEVEL_MAPPING(XX)
#undef XX
    default:
      return "";
  }
}

} // extern "C"
