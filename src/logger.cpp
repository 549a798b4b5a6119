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

#include "logger.hpp"

#include "get_time.hpp"

using namespace atomics::internal;

extern "C" {

void atomics_log_set_level(AtomicsLogLevel log_level) { Logger::set_log_level(log_level); }

void atomics_log_set_callback(AtomicsLogCallback callback, void* data) {
  Logger::set_callback(callback, data);
}

} // extern "C"

namespace {

void stderr_log_callback(const AtomicsLogMessage* message, void* data) {
  fprintf(stderr, "%u.%03u [%s] (%s:%d:%s): %s\n",
          static_cast<unsigned int>(message->time_ms / 1000),
          static_cast<unsigned int>(message->time_ms % 1000),
          atomics_log_level_string(message->severity), message->file, message->line,
          message->function, message->message);
}

void noop_log_callback(const AtomicsLogMessage* message, void* data) {}

} // namespace

AtomicsLogLevel Logger::log_level_ = ATOMICS_LOG_WARN;
AtomicsLogCallback Logger::cb_ = stderr_log_callback;
void* Logger::data_ = NULL;

void Logger::internal_log(AtomicsLogLevel severity, const char* file, int line,
                          const char* function, const char* format, va_list args) {
  AtomicsLogMessage message = { get_time_since_epoch_ms(), severity, file, line, function, "" };
  vsnprintf(message.message, sizeof(message.message), format, args);
  Logger::cb_(&message, Logger::data_);
}

void Logger::set_log_level(AtomicsLogLevel log_level) { log_level_ = log_level; }

void Logger::set_callback(AtomicsLogCallback cb, void* data) {
  cb_ = cb == NULL ? noop_log_callback : cb;
  data_ = data;
}
