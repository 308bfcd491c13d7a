// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <exception>
#include <string>
#include <string_view>
#include <type_traits>

#include <npbridge/abi.h>
#include <npbridge/converter.hpp>
#include <npbridge/exception.hpp>
#include <npbridge/export.hpp>

namespace npbridge {

// Error type of exports that declare none. Never thrown.
struct NoError {
};

namespace impl {
NPBRIDGE_API void set_success(npbridge_call_status* status) noexcept;
NPBRIDGE_API void set_fault(npbridge_call_status* status,
                            std::string_view diagnostic) noexcept;
NPBRIDGE_API void log_entry(std::string_view name);

// Classifies the exception currently being handled.
NPBRIDGE_API std::string describe_current_exception() noexcept;

template <typename E>
void set_typed_error(npbridge_call_status* status, const E& err) noexcept
{
  try {
    auto payload = lower_into_buffer(err);
    status->code = NPBRIDGE_CALL_TYPED_ERROR;
    status->payload = payload;
  } catch (const std::exception& ex) {
    set_fault(status, std::string("failed to lower error: ") + ex.what());
  }
}
} // namespace impl

// Lifts one argument; a malformed value is reported with the argument name.
template <typename T>
T lift_arg(std::string_view name, typename FfiConverter<T>::abi_type v)
{
  try {
    return FfiConverter<T>::lift(v);
  } catch (const ConversionFault& ex) {
    throw ConversionFault("failed to convert arg '" + std::string(name) +
                          "': " + ex.what());
  }
}

// Runs fn at a boundary entry and reports its outcome through status.
// fn returns the already lowered value. E is the declared error type: an
// exception of exactly that type becomes a typed error, anything else an
// unrecoverable fault. Nothing escapes.
template <typename E, typename Fn>
auto call_with_result(npbridge_call_status* status, Fn&& fn) noexcept
    -> decltype(fn())
{
  using R = decltype(fn());
  impl::set_success(status);
  try {
    if constexpr (std::is_void_v<R>) {
      fn();
      return;
    } else {
      return fn();
    }
  } catch (const E& err) {
    if constexpr (std::is_same_v<E, NoError>)
      impl::set_fault(status, "NoError thrown");
    else
      impl::set_typed_error(status, err);
  } catch (...) {
    impl::set_fault(status, impl::describe_current_exception());
  }
  if constexpr (!std::is_void_v<R>)
    return R{};
}

template <typename Fn>
auto call_with_output(npbridge_call_status* status, Fn&& fn) noexcept
    -> decltype(fn())
{
  return call_with_result<NoError>(status, std::forward<Fn>(fn));
}

} // namespace npbridge
