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

#ifndef UNIT_TEST_HPP
#define UNIT_TEST_HPP

#include "atomics.h"

#include <gtest/gtest.h>
#include <uv.h>

#include <map>
#include <string>
#include <vector>

#define NUM_THREADS 4
#define NUM_ITERATIONS 10000

class Unit : public testing::Test {
public:
  Unit();
  virtual ~Unit();

  /**
   * Add criteria to the search criteria for incoming log messages
   *
   * @param criteria Criteria to add
   * @param severity Only match messages of this severity. ATOMICS_LOG_LAST_ENTRY
   *                 matches any severity.
   */
  void add_logging_critera(const std::string& criteria,
                           AtomicsLogLevel severity = ATOMICS_LOG_LAST_ENTRY);

  /**
   * Get the number of log messages that matched the search criteria
   *
   * @return Number of matched log messages
   */
  int logging_criteria_count();

  /**
   * Clear the logging criteria and reset the count
   */
  void reset_logging_criteria();

private:
  static void on_log(const AtomicsLogMessage* message, void* data);

private:
  typedef std::map<AtomicsLogLevel, std::vector<std::string> > LoggingCriteria;

  LoggingCriteria logging_criteria_;
  int logging_criteria_count_;
  uv_mutex_t mutex_;
};

#endif // UNIT_TEST_HPP
