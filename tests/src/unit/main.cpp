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

#include "atomics.h"

#include <iostream>
#include <string>

/**
 * Bootstrap listener for handling start and end of the unit tests.
 */
class BootstrapListener : public testing::EmptyTestEventListener {
  void OnTestProgramStart(const testing::UnitTest& unit_test) {
    std::cout << "Starting Atomics Unit Test" << std::endl;
    std::cout << "  v" << ATOMICS_VERSION_MAJOR << "." << ATOMICS_VERSION_MINOR << "."
              << ATOMICS_VERSION_PATCH;
    if (!std::string(ATOMICS_VERSION_SUFFIX).empty()) {
      std::cout << "-" << ATOMICS_VERSION_SUFFIX;
    }
    std::cout << std::endl;
  }

  void OnTestProgramEnd(const testing::UnitTest& unit_test) {
    std::cout << "Finishing Atomics Unit Test" << std::endl;
  }
};

int main(int argc, char* argv[]) {
  // Initialize the Google testing framework
  testing::InitGoogleTest(&argc, argv);

  // Add listeners for program start and finish events
  testing::TestEventListeners& listeners = testing::UnitTest::GetInstance()->listeners();
  listeners.Append(new BootstrapListener());

  // Run the unit tests
  return RUN_ALL_TESTS();
}
