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

#ifndef ATOMICS_INTERNAL_CALLBACK_HPP
#define ATOMICS_INTERNAL_CALLBACK_HPP

#include "aligned_storage.hpp"
#include "macros.hpp"

#include <new>
#include <stddef.h>

namespace atomics { namespace internal {

// Large enough to fit:
// - A vtable pointer (8 bytes).
// - A member function pointer or a function pointer (this can be a fat
//   pointer of up to 16 bytes).
// - A pointer/int data parameter (8 bytes).
typedef AlignedStorage<32, 8> CallbackStorage;

struct FunctionWithDataDummy {};

/**
 * A copyable holder for a unary function: a plain function, a function with a
 * bound data argument, or a member function bound to an object. A default
 * constructed callback is empty and evaluates to false.
 */
template <class R, class Arg>
class Callback {
public:
  Callback()
      : invoker_(NULL) {}

  template <class F, class T>
  Callback(F func, T* object)
      : invoker_(new (&storage_) MemberInvoker<F, T>(func, object)) {
    typedef MemberInvoker<F, T> MemberInvoker;
    STATIC_ASSERT(sizeof(CallbackStorage) >= sizeof(MemberInvoker));
    STATIC_ASSERT(ALIGN_OF(CallbackStorage) >= ALIGN_OF(MemberInvoker));
  }

  template <class F>
  explicit Callback(F func)
      : invoker_(new (&storage_) FunctionInvoker<F>(func)) {
    typedef FunctionInvoker<F> FunctionInvoker;
    STATIC_ASSERT(sizeof(CallbackStorage) >= sizeof(FunctionInvoker));
    STATIC_ASSERT(ALIGN_OF(CallbackStorage) >= ALIGN_OF(FunctionInvoker));
  }

  template <class F, class D>
  Callback(F func, const D& data, FunctionWithDataDummy)
      : invoker_(new (&storage_) FunctionWithDataInvoker<F, D>(func, data)) {
    typedef FunctionWithDataInvoker<F, D> FunctionWithDataInvoker;
    STATIC_ASSERT(sizeof(CallbackStorage) >= sizeof(FunctionWithDataInvoker));
    STATIC_ASSERT(ALIGN_OF(CallbackStorage) >= ALIGN_OF(FunctionWithDataInvoker));
  }

  Callback(const Callback& other)
      : invoker_(other.invoker_ ? other.invoker_->copy(&storage_) : NULL) {}

  Callback& operator=(const Callback& other) {
    if (this != &other) {
      invoker_ = other.invoker_ ? other.invoker_->copy(&storage_) : NULL;
    }
    return *this;
  }

  operator bool() const { return invoker_ != NULL; }

  R operator()(const Arg& arg) const { return invoker_->invoke(arg); }

private:
  struct Invoker {
    virtual R invoke(const Arg& arg) const = 0;
    virtual Invoker* copy(CallbackStorage* storage) const = 0;
  };

  template <class F, class T>
  struct MemberInvoker : public Invoker {
    MemberInvoker(F func, T* object)
        : func(func)
        , object(object) {}

    R invoke(const Arg& arg) const { return (object->*func)(arg); }

    Invoker* copy(CallbackStorage* storage) const {
      return new (storage) MemberInvoker<F, T>(func, object);
    }

    F func;
    T* object;
  };

  template <class F>
  struct FunctionInvoker : public Invoker {
    FunctionInvoker(F func)
        : func(func) {}

    R invoke(const Arg& arg) const { return func(arg); }

    Invoker* copy(CallbackStorage* storage) const {
      return new (storage) FunctionInvoker<F>(func);
    }

    F func;
  };

  template <class F, class D>
  struct FunctionWithDataInvoker : public Invoker {
    FunctionWithDataInvoker(F func, D data)
        : func(func)
        , data(data) {}

    R invoke(const Arg& arg) const { return func(arg, data); }

    Invoker* copy(CallbackStorage* storage) const {
      return new (storage) FunctionWithDataInvoker<F, D>(func, data);
    }

    F func;
    D data;
  };

private:
  Invoker* invoker_;
  CallbackStorage storage_;
};

/**
 * The two argument counterpart of Callback<>.
 */
template <class R, class Arg1, class Arg2>
class BinaryCallback {
public:
  BinaryCallback()
      : invoker_(NULL) {}

  template <class F, class T>
  BinaryCallback(F func, T* object)
      : invoker_(new (&storage_) MemberInvoker<F, T>(func, object)) {
    typedef MemberInvoker<F, T> MemberInvoker;
    STATIC_ASSERT(sizeof(CallbackStorage) >= sizeof(MemberInvoker));
    STATIC_ASSERT(ALIGN_OF(CallbackStorage) >= ALIGN_OF(MemberInvoker));
  }

  template <class F>
  explicit BinaryCallback(F func)
      : invoker_(new (&storage_) FunctionInvoker<F>(func)) {
    typedef FunctionInvoker<F> FunctionInvoker;
    STATIC_ASSERT(sizeof(CallbackStorage) >= sizeof(FunctionInvoker));
    STATIC_ASSERT(ALIGN_OF(CallbackStorage) >= ALIGN_OF(FunctionInvoker));
  }

  template <class F, class D>
  BinaryCallback(F func, const D& data, FunctionWithDataDummy)
      : invoker_(new (&storage_) FunctionWithDataInvoker<F, D>(func, data)) {
    typedef FunctionWithDataInvoker<F, D> FunctionWithDataInvoker;
    STATIC_ASSERT(sizeof(CallbackStorage) >= sizeof(FunctionWithDataInvoker));
    STATIC_ASSERT(ALIGN_OF(CallbackStorage) >= ALIGN_OF(FunctionWithDataInvoker));
  }

  BinaryCallback(const BinaryCallback& other)
      : invoker_(other.invoker_ ? other.invoker_->copy(&storage_) : NULL) {}

  BinaryCallback& operator=(const BinaryCallback& other) {
    if (this != &other) {
      invoker_ = other.invoker_ ? other.invoker_->copy(&storage_) : NULL;
    }
    return *this;
  }

  operator bool() const { return invoker_ != NULL; }

  R operator()(const Arg1& arg1, const Arg2& arg2) const { return invoker_->invoke(arg1, arg2); }

private:
  struct Invoker {
    virtual R invoke(const Arg1& arg1, const Arg2& arg2) const = 0;
    virtual Invoker* copy(CallbackStorage* storage) const = 0;
  };

  template <class F, class T>
  struct MemberInvoker : public Invoker {
    MemberInvoker(F func, T* object)
        : func(func)
        , object(object) {}

    R invoke(const Arg1& arg1, const Arg2& arg2) const { return (object->*func)(arg1, arg2); }

    Invoker* copy(CallbackStorage* storage) const {
      return new (storage) MemberInvoker<F, T>(func, object);
    }

    F func;
    T* object;
  };

  template <class F>
  struct FunctionInvoker : public Invoker {
    FunctionInvoker(F func)
        : func(func) {}

    R invoke(const Arg1& arg1, const Arg2& arg2) const { return func(arg1, arg2); }

    Invoker* copy(CallbackStorage* storage) const {
      return new (storage) FunctionInvoker<F>(func);
    }

    F func;
  };

  template <class F, class D>
  struct FunctionWithDataInvoker : public Invoker {
    FunctionWithDataInvoker(F func, D data)
        : func(func)
        , data(data) {}

    R invoke(const Arg1& arg1, const Arg2& arg2) const { return func(arg1, arg2, data); }

    Invoker* copy(CallbackStorage* storage) const {
      return new (storage) FunctionWithDataInvoker<F, D>(func, data);
    }

    F func;
    D data;
  };

private:
  Invoker* invoker_;
  CallbackStorage storage_;
};

template <class R, class Arg, class T>
Callback<R, Arg> bind_callback(R (T::*func)(Arg), T* object) {
  return Callback<R, Arg>(func, object);
}

template <class R, class Arg>
Callback<R, Arg> bind_callback(R (*func)(Arg)) {
  return Callback<R, Arg>(func);
}

template <class R, class Arg, class D>
Callback<R, Arg> bind_callback(R (*func)(Arg, D), const D& data) {
  return Callback<R, Arg>(func, data, FunctionWithDataDummy());
}

template <class R, class Arg1, class Arg2, class T>
BinaryCallback<R, Arg1, Arg2> bind_callback(R (T::*func)(Arg1, Arg2), T* object) {
  return BinaryCallback<R, Arg1, Arg2>(func, object);
}

template <class R, class Arg1, class Arg2>
BinaryCallback<R, Arg1, Arg2> bind_callback(R (*func)(Arg1, Arg2)) {
  return BinaryCallback<R, Arg1, Arg2>(func);
}

template <class R, class Arg1, class Arg2, class D>
BinaryCallback<R, Arg1, Arg2> bind_callback(R (*func)(Arg1, Arg2, D), const D& data) {
  return BinaryCallback<R, Arg1, Arg2>(func, data, FunctionWithDataDummy());
}

}} // namespace atomics::internal

#endif
