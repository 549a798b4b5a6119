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

#ifndef __ATOMICS_H_INCLUDED__
#define __ATOMICS_H_INCLUDED__

#include <stddef.h>

#if !defined(ATOMICS_STATIC)
#  if (defined(WIN32) || defined(_WIN32))
#    if defined(ATOMICS_BUILDING)
#      define ATOMICS_EXPORT __declspec(dllexport)
#    else
#      define ATOMICS_EXPORT __declspec(dllimport)
#    endif
#  elif (defined(__SUNPRO_C)  || defined(__SUNPRO_CC)) && !defined(ATOMICS_STATIC)
#    define ATOMICS_EXPORT __global
#  elif (defined(__GNUC__) && __GNUC__ >= 4) || defined(__INTEL_COMPILER)
#    define ATOMICS_EXPORT __attribute__ ((visibility("default")))
#  endif
#else
#define ATOMICS_EXPORT
#endif

#if !defined(ATOMICS_EXPORT)
#define ATOMICS_EXPORT
#endif

/**
 * @file include/atomics.h
 *
 * Lock-free 64-bit integer counters. Every operation on an AtomicsLong is
 * linearizable and safe to call from any number of threads without external
 * locking.
 */

#define ATOMICS_VERSION_MAJOR 1
#define ATOMICS_VERSION_MINOR 0
#define ATOMICS_VERSION_PATCH 0
#define ATOMICS_VERSION_SUFFIX ""

#ifdef __cplusplus
extern "C" {
#endif

typedef enum { atomics_false = 0, atomics_true = 1 } atomics_bool_t;

#if defined(__INT64_TYPE__) && defined(__UINT64_TYPE__)
typedef __INT64_TYPE__ atomics_int64_t;
typedef __UINT64_TYPE__ atomics_uint64_t;
#elif defined(__INT64_TYPE__)
typedef __INT64_TYPE__ atomics_int64_t;
typedef unsigned __INT64_TYPE__ atomics_uint64_t;
#elif defined(__GNUC__)
#  if  defined(__x86_64__)
typedef long int atomics_int64_t;
typedef unsigned long int atomics_uint64_t;
#  else
typedef long long int atomics_int64_t;
typedef unsigned long long int atomics_uint64_t;
#  endif
#else
typedef long long atomics_int64_t;
typedef unsigned long long atomics_uint64_t;
#endif

#define ATOMICS_INT64_MAX 9223372036854775807LL
#define ATOMICS_INT64_MIN (-ATOMICS_INT64_MAX - 1)

/**
 * The size of the buffer required by atomics_long_string(): the longest
 * decimal int64 ("-9223372036854775808") plus a NULL terminator.
 */
#define ATOMICS_LONG_STRING_LENGTH 21

/***********************************************************************************
 *
 * Types
 *
 ***********************************************************************************/

/**
 * A 64-bit signed integer that is read and modified with atomic operations.
 * The instance is shared by reference; copying the underlying storage is not
 * supported.
 *
 * @struct AtomicsLong
 */
typedef struct AtomicsLong_ AtomicsLong;

/**
 * A function used to compute a new value from the current value.
 *
 * <b>Note:</b> The function may be invoked more than once with different
 * snapshots of the current value when there is contention. It must be free of
 * side effects that can't be repeated.
 *
 * @param[in] value The current value.
 * @param[in] data User defined data provided with the callback.
 * @return The new value.
 *
 * @see atomics_long_update()
 * @see atomics_long_try_update()
 */
typedef atomics_int64_t (*AtomicsLongUpdateCallback)(atomics_int64_t value,
                                                     void* data);

/**
 * A function used to combine the current value with an operand.
 *
 * @param[in] value The current value.
 * @param[in] x The operand passed to atomics_long_accumulate().
 * @param[in] data User defined data provided with the callback.
 * @return The new value.
 *
 * @see atomics_long_accumulate()
 */
typedef atomics_int64_t (*AtomicsLongAccumulateCallback)(atomics_int64_t value,
                                                         atomics_int64_t x,
                                                         void* data);

#define ATOMICS_LOG_LEVEL_MAPPING(XX) \
  XX(ATOMICS_LOG_DISABLED, "") \
  XX(ATOMICS_LOG_CRITICAL, "CRITICAL") \
  XX(ATOMICS_LOG_ERROR, "ERROR") \
  XX(ATOMICS_LOG_WARN, "WARN") \
  XX(ATOMICS_LOG_INFO, "INFO") \
  XX(ATOMICS_LOG_DEBUG, "DEBUG") \
  XX(ATOMICS_LOG_TRACE, "TRACE")

typedef enum AtomicsLogLevel_ {
#define XX_LOG(log_level, _) log_level,
  ATOMICS_LOG_LEVEL_MAPPING(XX_LOG)
#undef XX_LOG
  /* @cond IGNORE */
  ATOMICS_LOG_LAST_ENTRY
  /* @endcond */
} AtomicsLogLevel;

typedef enum AtomicsErrorSource_ {
  ATOMICS_ERROR_SOURCE_NONE,
  ATOMICS_ERROR_SOURCE_LIB
} AtomicsErrorSource;

#define ATOMICS_ERROR_MAPPING(XX) \
  XX(ATOMICS_ERROR_SOURCE_LIB, ATOMICS_ERROR_LIB_BAD_PARAMS, 1, "Bad parameters") \
  XX(ATOMICS_ERROR_SOURCE_LIB, ATOMICS_ERROR_LIB_NULL_CALLBACK, 2, "NULL callback specified")

#define ATOMICS_ERROR(source, code) ((source << 24) | code)

typedef enum AtomicsError_ {
  ATOMICS_OK = 0,
#define XX_ERROR(source, name, code, _) name = ATOMICS_ERROR(source, code),
  ATOMICS_ERROR_MAPPING(XX_ERROR)
#undef XX_ERROR
  /* @cond IGNORE */
  ATOMICS_ERROR_LAST_ENTRY
  /* @endcond*/
} AtomicsError;

/**
 * Maximum size of a log message
 */
#define ATOMICS_LOG_MAX_MESSAGE_SIZE 1024

/**
 * A log message.
 */
typedef struct AtomicsLogMessage_ {
  /**
   * The millisecond timestamp (since the Epoch) when the message was logged
   */
  atomics_uint64_t time_ms;
  AtomicsLogLevel severity; /**< The severity of the log message */
  const char* file; /**< The file where the message was logged */
  int line; /**< The line in the file where the message was logged */
  const char* function; /**< The function where the message was logged */
  char message[ATOMICS_LOG_MAX_MESSAGE_SIZE]; /**< The message */
} AtomicsLogMessage;

/**
 * A callback that's used to handle logging.
 *
 * @param[in] message
 * @param[in] data user defined data provided when the callback
 * was registered.
 *
 * @see atomics_log_set_callback()
 */
typedef void (*AtomicsLogCallback)(const AtomicsLogMessage* message,
                                   void* data);

/***********************************************************************************
 *
 * Atomic long
 *
 ***********************************************************************************/

/**
 * Creates a new atomic long.
 *
 * @public @memberof AtomicsLong
 *
 * @param[in] initial_value
 * @return Returns an atomic long that must be freed.
 *
 * @see atomics_long_free()
 */
ATOMICS_EXPORT AtomicsLong*
atomics_long_new(atomics_int64_t initial_value);

/**
 * Frees an atomic long instance.
 *
 * @public @memberof AtomicsLong
 *
 * @param[in] atomic_long
 */
ATOMICS_EXPORT void
atomics_long_free(AtomicsLong* atomic_long);

/**
 * Determines whether the platform provides the value without an internal lock.
 *
 * @public @memberof AtomicsLong
 *
 * @param[in] atomic_long
 * @return atomics_true if lock-free, otherwise atomics_false.
 */
ATOMICS_EXPORT atomics_bool_t
atomics_long_is_lock_free(const AtomicsLong* atomic_long);

/**
 * Reads the current value. All writes that completed before the read are
 * visible.
 *
 * @public @memberof AtomicsLong
 *
 * @param[in] atomic_long
 * @return The current value.
 */
ATOMICS_EXPORT atomics_int64_t
atomics_long_read(const AtomicsLong* atomic_long);

/**
 * Writes a new value.
 *
 * @public @memberof AtomicsLong
 *
 * @param[in] atomic_long
 * @param[in] value
 */
ATOMICS_EXPORT void
atomics_long_write(AtomicsLong* atomic_long,
                   atomics_int64_t value);

/**
 * Sets the value and returns the value immediately prior.
 *
 * @public @memberof AtomicsLong
 *
 * @param[in] atomic_long
 * @param[in] value
 * @return The previous value.
 */
ATOMICS_EXPORT atomics_int64_t
atomics_long_exchange(AtomicsLong* atomic_long,
                      atomics_int64_t value);

/**
 * Sets the value to `value` if the current value equals `comparand`.
 *
 * @public @memberof AtomicsLong
 *
 * @param[in] atomic_long
 * @param[in] value The value to set if the comparison succeeds.
 * @param[in] comparand The expected current value.
 * @return The value observed by the operation, whether or not it matched.
 */
ATOMICS_EXPORT atomics_int64_t
atomics_long_compare_exchange(AtomicsLong* atomic_long,
                              atomics_int64_t value,
                              atomics_int64_t comparand);

/**
 * Same as atomics_long_compare_exchange(), but reports whether the value was
 * replaced.
 *
 * @public @memberof AtomicsLong
 *
 * @param[in] atomic_long
 * @param[in] value
 * @param[in] comparand
 * @return atomics_true if the value was replaced, otherwise atomics_false.
 */
ATOMICS_EXPORT atomics_bool_t
atomics_long_try_compare_exchange(AtomicsLong* atomic_long,
                                  atomics_int64_t value,
                                  atomics_int64_t comparand);

/**
 * Increments the value by one. Wraps on overflow.
 *
 * @public @memberof AtomicsLong
 *
 * @param[in] atomic_long
 * @return The value after the increment.
 */
ATOMICS_EXPORT atomics_int64_t
atomics_long_increment(AtomicsLong* atomic_long);

/**
 * Decrements the value by one. Wraps on overflow.
 *
 * @public @memberof AtomicsLong
 *
 * @param[in] atomic_long
 * @return The value after the decrement.
 */
ATOMICS_EXPORT atomics_int64_t
atomics_long_decrement(AtomicsLong* atomic_long);

/**
 * Adds `delta` to the value. Wraps on overflow.
 *
 * @public @memberof AtomicsLong
 *
 * @param[in] atomic_long
 * @param[in] delta
 * @return The value after the addition.
 */
ATOMICS_EXPORT atomics_int64_t
atomics_long_add(AtomicsLong* atomic_long,
                 atomics_int64_t delta);

/**
 * Increments the value by one.
 *
 * @public @memberof AtomicsLong
 *
 * @param[in] atomic_long
 * @return The value before the increment.
 */
ATOMICS_EXPORT atomics_int64_t
atomics_long_get_and_increment(AtomicsLong* atomic_long);

/**
 * Decrements the value by one.
 *
 * @public @memberof AtomicsLong
 *
 * @param[in] atomic_long
 * @return The value before the decrement.
 */
ATOMICS_EXPORT atomics_int64_t
atomics_long_get_and_decrement(AtomicsLong* atomic_long);

/**
 * Adds `delta` to the value.
 *
 * @public @memberof AtomicsLong
 *
 * @param[in] atomic_long
 * @param[in] delta
 * @return The value before the addition.
 */
ATOMICS_EXPORT atomics_int64_t
atomics_long_get_and_add(AtomicsLong* atomic_long,
                         atomics_int64_t delta);

/**
 * Adds `delta` to the value.
 *
 * @public @memberof AtomicsLong
 *
 * @param[in] atomic_long
 * @param[in] delta
 * @return The value after the addition.
 */
ATOMICS_EXPORT atomics_int64_t
atomics_long_add_and_get(AtomicsLong* atomic_long,
                         atomics_int64_t delta);

/**
 * Increments the value by one.
 *
 * @public @memberof AtomicsLong
 *
 * @param[in] atomic_long
 * @return The value after the increment.
 */
ATOMICS_EXPORT atomics_int64_t
atomics_long_increment_and_get(AtomicsLong* atomic_long);

/**
 * Decrements the value by one.
 *
 * @public @memberof AtomicsLong
 *
 * @param[in] atomic_long
 * @return The value after the decrement.
 */
ATOMICS_EXPORT atomics_int64_t
atomics_long_decrement_and_get(AtomicsLong* atomic_long);

/**
 * Makes a single attempt to replace the value with `value` if `value` is
 * strictly greater than the current value. The attempt fails, without
 * retrying, if another thread changes the value concurrently.
 *
 * @public @memberof AtomicsLong
 *
 * @param[in] atomic_long
 * @param[in] value
 * @return atomics_true if the value was replaced, otherwise atomics_false.
 */
ATOMICS_EXPORT atomics_bool_t
atomics_long_try_set_if_greater(AtomicsLong* atomic_long,
                                atomics_int64_t value);

/**
 * Mirror of atomics_long_try_set_if_greater() for strictly-less values.
 *
 * @public @memberof AtomicsLong
 *
 * @param[in] atomic_long
 * @param[in] value
 * @return atomics_true if the value was replaced, otherwise atomics_false.
 */
ATOMICS_EXPORT atomics_bool_t
atomics_long_try_set_if_less(AtomicsLong* atomic_long,
                             atomics_int64_t value);

/**
 * Ensures the value is at least `value`, retrying under contention until the
 * value is replaced or the current value is already greater or equal.
 *
 * @public @memberof AtomicsLong
 *
 * @param[in] atomic_long
 * @param[in] value
 * @return The value in effect when the operation completes.
 */
ATOMICS_EXPORT atomics_int64_t
atomics_long_set_if_greater(AtomicsLong* atomic_long,
                            atomics_int64_t value);

/**
 * Ensures the value is at most `value`, retrying under contention until the
 * value is replaced or the current value is already less or equal.
 *
 * @public @memberof AtomicsLong
 *
 * @param[in] atomic_long
 * @param[in] value
 * @return The value in effect when the operation completes.
 */
ATOMICS_EXPORT atomics_int64_t
atomics_long_set_if_less(AtomicsLong* atomic_long,
                         atomics_int64_t value);

/**
 * Replaces the value with the result of `callback` using a compare-and-swap
 * loop. The loop retries until the swap succeeds; it is lock-free, but an
 * individual caller can be delayed indefinitely under heavy contention.
 *
 * @public @memberof AtomicsLong
 *
 * @param[in] atomic_long
 * @param[in] callback
 * @param[in] data User defined data passed to the callback.
 * @param[out] output The installed value.
 * @return ATOMICS_OK if successful, otherwise an error occurred.
 *
 * @see AtomicsLongUpdateCallback
 */
ATOMICS_EXPORT AtomicsError
atomics_long_update(AtomicsLong* atomic_long,
                    AtomicsLongUpdateCallback callback,
                    void* data,
                    atomics_int64_t* output);

/**
 * Makes a single compare-and-swap attempt to replace the value with the result
 * of `callback`. The observed and computed values are returned whether or not
 * the attempt succeeded.
 *
 * @public @memberof AtomicsLong
 *
 * @param[in] atomic_long
 * @param[in] callback
 * @param[in] data User defined data passed to the callback.
 * @param[out] original The value the callback was applied to.
 * @param[out] updated The value computed by the callback.
 * @param[out] is_updated atomics_true if `updated` was installed.
 * @return ATOMICS_OK if successful, otherwise an error occurred. A lost race
 * is not an error; check `is_updated`.
 */
ATOMICS_EXPORT AtomicsError
atomics_long_try_update(AtomicsLong* atomic_long,
                        AtomicsLongUpdateCallback callback,
                        void* data,
                        atomics_int64_t* original,
                        atomics_int64_t* updated,
                        atomics_bool_t* is_updated);

/**
 * Replaces the value with `callback(value, x)` using a compare-and-swap loop.
 *
 * @public @memberof AtomicsLong
 *
 * @param[in] atomic_long
 * @param[in] x
 * @param[in] callback
 * @param[in] data User defined data passed to the callback.
 * @param[out] output The installed value.
 * @return ATOMICS_OK if successful, otherwise an error occurred.
 *
 * @see AtomicsLongAccumulateCallback
 */
ATOMICS_EXPORT AtomicsError
atomics_long_accumulate(AtomicsLong* atomic_long,
                        atomics_int64_t x,
                        AtomicsLongAccumulateCallback callback,
                        void* data,
                        atomics_int64_t* output);

/**
 * Writes the decimal form of the current value.
 *
 * @public @memberof AtomicsLong
 *
 * @param[in] atomic_long
 * @param[out] output A NULL-terminated string of length ATOMICS_LONG_STRING_LENGTH.
 */
ATOMICS_EXPORT void
atomics_long_string(const AtomicsLong* atomic_long,
                    char* output);

/***********************************************************************************
 *
 * Error
 *
 ***********************************************************************************/

/**
 * Gets a description for an error code.
 *
 * @param[in] error
 * @return A null-terminated string describing the error.
 */
ATOMICS_EXPORT const char*
atomics_error_desc(AtomicsError error);

/***********************************************************************************
 *
 * Log
 *
 ***********************************************************************************/

/**
 * Sets the log level.
 *
 * <b>Note:</b> This needs to be done before any call that might log, such as
 * any of the atomics_long_*() functions.
 *
 * <b>Default:</b> ATOMICS_LOG_WARN
 *
 * @param[in] log_level
 */
ATOMICS_EXPORT void
atomics_log_set_level(AtomicsLogLevel log_level);

/**
 * Sets a callback for handling logging events.
 *
 * <b>Note:</b> This needs to be done before any call that might log.
 *
 * <b>Default:</b> An internal callback that prints to stderr
 *
 * @param[in] callback A NULL callback disables logging.
 * @param[in] data An opaque data object passed to the callback.
 */
ATOMICS_EXPORT void
atomics_log_set_callback(AtomicsLogCallback callback,
                         void* data);

/**
 * Gets the string for a log level.
 *
 * @param[in] log_level
 * @return A null-terminated string for the log level.
 * Example: "ERROR", "WARN", "INFO", etc.
 */
ATOMICS_EXPORT const char*
atomics_log_level_string(AtomicsLogLevel log_level);

#ifdef __cplusplus
} /* extern "C" */
#endif

#endif /* __ATOMICS_H_INCLUDED__ */
