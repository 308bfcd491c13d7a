// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <npbridge/future.hpp>

#include "logging.hpp"

namespace npbridge::impl {

bool FutureState::poll(npbridge_completion_callback cb, void* env)
{
  std::lock_guard<std::mutex> lk(mutex_);
  switch (state_) {
  case State::Completed:
    return true;
  case State::Running:
    if (callback_ && callback_ != cb)
      NPBRIDGE_LOG_TRACE("future {}: completion callback superseded",
                         static_cast<const void*>(this));
    callback_ = cb;
    callback_env_ = env;
    return false;
  default:
    throw Exception("future polled after release");
  }
}

void FutureState::release() noexcept
{
  std::function<void()> cancel;
  {
    std::unique_lock<std::mutex> lk(mutex_);
    if (state_ == State::Running)
      cancel = std::move(canceller_);
    canceller_ = nullptr;
    state_ = State::Released;
    callback_ = nullptr;
    callback_env_ = nullptr;
    // A release from inside the callback must not wait for itself.
    if (notifying_ && notifier_ != std::this_thread::get_id())
      notified_cv_.wait(lk, [this] { return !notifying_; });
  }

  if (!cancel)
    return;
  try {
    cancel();
  } catch (const std::exception& ex) {
    // The outcome is dropped all the same.
    NPBRIDGE_LOG_WARN("future {}: cannot cancel the running body: {}",
                      static_cast<const void*>(this), ex.what());
  }
}

void FutureState::set_canceller(std::function<void()> canceller)
{
  std::lock_guard<std::mutex> lk(mutex_);
  canceller_ = std::move(canceller);
}

FutureState::State FutureState::state() const
{
  std::lock_guard<std::mutex> lk(mutex_);
  return state_;
}

void FutureState::notify(npbridge_completion_callback cb, void* env) noexcept
{
  cb(env);
  {
    std::lock_guard<std::mutex> lk(mutex_);
    notifying_ = false;
  }
  notified_cv_.notify_all();
}

void release_future(npbridge_future* handle) noexcept
{
  if (!handle)
    return;
  if (handle->state)
    handle->state->release();
  delete handle;
}

} // namespace npbridge::impl
