// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>
#include <variant>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/version.hpp>
#if BOOST_VERSION >= 107700
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#endif

#include <npbridge/abi.h>
#include <npbridge/call.hpp>
#include <npbridge/converter.hpp>
#include <npbridge/exception.hpp>
#include <npbridge/export.hpp>

namespace npbridge::impl {

// State machine shared by every asynchronous invocation:
//
//   Running --body finishes--> Completed   (outcome stored, callback fired)
//   Running --release-------->  Released   (body cancelled, outcome dropped)
//   Completed --release------>  Released
//
// One mutex guards the state and the callback slot. The callback is invoked
// without holding it, so the callback may poll again from inside.
class NPBRIDGE_API FutureState
{
public:
  enum class State { Running, Completed, Released };

  /// Returns true when the outcome is available. Otherwise stores cb as the
  /// only registered callback, replacing any previous one, and returns false.
  bool poll(npbridge_completion_callback cb, void* env);

  /// Moves to Released. A callback that was not fired yet never will be.
  /// A running body is asked to stop through the canceller. Does not wait
  /// for the native body; it waits only for a callback that another thread
  /// is invoking right now.
  void release() noexcept;

  State state() const;

  /// Installed before the body starts; invoked once by a release while
  /// Running.
  void set_canceller(std::function<void()> canceller);

  virtual ~FutureState() = default;

protected:
  // store() writes the outcome; it runs under the lock and is skipped when
  // the handle was already released.
  template <typename Fn> void complete(Fn&& store)
  {
    npbridge_completion_callback cb = nullptr;
    void* env = nullptr;
    {
      std::lock_guard<std::mutex> lk(mutex_);
      if (state_ != State::Running)
        return;
      store();
      state_ = State::Completed;
      canceller_ = nullptr;
      cb = std::exchange(callback_, nullptr);
      env = std::exchange(callback_env_, nullptr);
      if (!cb)
        return;
      notifying_ = true;
      notifier_ = std::this_thread::get_id();
    }
    notify(cb, env);
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable notified_cv_;
  State state_ = State::Running;
  npbridge_completion_callback callback_ = nullptr;
  void* callback_env_ = nullptr;
  bool notifying_ = false;
  std::thread::id notifier_;
  std::function<void()> canceller_;

  void notify(npbridge_completion_callback cb, void* env) noexcept;
};

template <typename T, typename E> class Future : public FutureState
{
public:
  using value_type = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

  struct Fault {
    std::string diagnostic;
  };

  // Index 0 success, 1 typed error, 2 unrecoverable fault. Accessed by
  // index because value_type and E may coincide.
  using Outcome = std::variant<value_type, E, Fault>;

  void resolve_value(value_type v)
  {
    complete(
        [&] { outcome_.emplace(std::in_place_index<0>, std::move(v)); });
  }

  void resolve_exception(std::exception_ptr eptr)
  {
    try {
      std::rethrow_exception(eptr);
    } catch (const E& err) {
      if constexpr (std::is_same_v<E, NoError>) {
        resolve_fault("NoError thrown");
      } else {
        complete([&] { outcome_.emplace(std::in_place_index<1>, err); });
      }
    } catch (...) {
      resolve_fault(describe_current_exception());
    }
  }

  void resolve_fault(std::string diagnostic)
  {
    complete([&] {
      outcome_.emplace(std::in_place_index<2>, Fault{std::move(diagnostic)});
    });
  }

  // Only valid once poll() returned true: the outcome is immutable from then
  // on and is lowered again for every poll.
  void write_outcome(abi_return_t<T>* out, npbridge_call_status* status) const
  {
    switch (outcome_->index()) {
    case 0:
      if constexpr (std::is_void_v<T>) {
        *out = 0;
      } else {
        *out = FfiConverter<T>::lower(std::get<0>(*outcome_));
      }
      set_success(status);
      break;
    case 1:
      if constexpr (!std::is_same_v<E, NoError>)
        set_typed_error(status, std::get<1>(*outcome_));
      break;
    default:
      set_fault(status, std::get<2>(*outcome_).diagnostic);
      break;
    }
  }

private:
  std::optional<Outcome> outcome_;
};

template <typename T, typename E>
boost::asio::awaitable<void> drive(std::shared_ptr<Future<T, E>> future,
                                   boost::asio::awaitable<T> body)
{
  std::exception_ptr eptr;
  try {
    if constexpr (std::is_void_v<T>) {
      co_await std::move(body);
      future->resolve_value({});
    } else {
      future->resolve_value(co_await std::move(body));
    }
  } catch (...) {
    eptr = std::current_exception();
  }
  if (eptr)
    future->resolve_exception(eptr);
}

// Keeps the arguments in this frame for as long as the native body runs, so
// native coroutines may take them by reference.
template <typename Fn, typename... Args>
std::invoke_result_t<Fn&, Args&...> call_in_frame(Fn fn, Args... args)
{
  co_return co_await fn(args...);
}

} // namespace npbridge::impl

struct npbridge_future {
  std::shared_ptr<npbridge::impl::FutureState> state;
};

namespace npbridge {

/// Starts fn(args...) on ex and returns the handle owned by the caller.
/// fn must return boost::asio::awaitable<T>.
template <typename T, typename E, typename Fn, typename... Args>
npbridge_future* start_future(boost::asio::any_io_executor ex, Fn fn,
                              Args... args)
{
  auto future = std::make_shared<impl::Future<T, E>>();
  auto handle = std::make_unique<npbridge_future>(npbridge_future{future});

  boost::asio::awaitable<T> body =
      impl::call_in_frame(std::move(fn), std::move(args)...);

  // emit() must not run concurrently with the body, so both use one strand.
  auto strand = boost::asio::make_strand(ex);
#if BOOST_VERSION >= 107700
  auto signal = std::make_shared<boost::asio::cancellation_signal>();
  future->set_canceller([strand, signal] {
    boost::asio::post(strand, [signal] {
      signal->emit(boost::asio::cancellation_type::terminal);
    });
  });
  boost::asio::co_spawn(
      strand, impl::drive(std::move(future), std::move(body)),
      boost::asio::bind_cancellation_slot(
          signal->slot(), [signal](std::exception_ptr eptr) {
            if (eptr)
              std::rethrow_exception(eptr);
          }));
#else
  // No per-operation cancellation before Boost 1.77: a released body runs to
  // its end and its outcome is dropped.
  boost::asio::co_spawn(strand,
                        impl::drive(std::move(future), std::move(body)),
                        boost::asio::detached);
#endif

  return handle.release();
}

namespace impl {
template <typename T, typename E>
std::shared_ptr<Future<T, E>> future_cast(npbridge_future* handle)
{
  if (!handle || !handle->state)
    throw Exception("null future handle");
  auto future = std::dynamic_pointer_cast<Future<T, E>>(handle->state);
  if (!future)
    throw Exception("future handle polled with mismatching result type");
  return future;
}

NPBRIDGE_API void release_future(npbridge_future* handle) noexcept;
} // namespace impl

// entry is the boundary entry name, used for logging only.
template <typename T, typename E>
bool future_poll(std::string_view entry, npbridge_future* handle,
                 npbridge_completion_callback cb, void* env,
                 abi_return_t<T>* out, npbridge_call_status* status) noexcept
{
  return call_with_output(status, [&] {
    impl::log_entry(entry);
    auto future = impl::future_cast<T, E>(handle);
    if (!future->poll(cb, env))
      return false;
    future->write_outcome(out, status);
    return true;
  });
}

template <typename T, typename E>
void future_release(std::string_view entry, npbridge_future* handle,
                    npbridge_call_status* status) noexcept
{
  call_with_output(status, [&] {
    impl::log_entry(entry);
    const bool matches =
        !handle || !handle->state ||
        std::dynamic_pointer_cast<impl::Future<T, E>>(handle->state);
    // The handle is gone either way.
    impl::release_future(handle);
    if (!matches)
      throw Exception("future handle released with mismatching result type");
  });
}

} // namespace npbridge
