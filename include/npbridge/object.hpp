// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>

#include <npbridge/export.hpp>

namespace npbridge {

// Base of every object that can be exported across the boundary.
// Lifetime is shared between native ObjectPtr holders and foreign handles;
// neither side is assumed to be the single owner.
class NPBRIDGE_API Object
{
  std::atomic<uint32_t> ref_cnt_{0};

public:
  uint32_t add_ref() noexcept
  {
    return ref_cnt_.fetch_add(1, std::memory_order_relaxed) + 1;
  }

  uint32_t release() noexcept
  {
    auto cnt = ref_cnt_.fetch_sub(1, std::memory_order_acq_rel) - 1;
    if (cnt == 0)
      delete this;
    return cnt;
  }

  uint32_t use_count() const noexcept
  {
    return ref_cnt_.load(std::memory_order_acquire);
  }

  std::string class_name() const;

  Object() = default;
  Object(const Object&) = delete;
  Object& operator=(const Object&) = delete;
  virtual ~Object() = default;
};

template <typename T> class ObjectPtr
{
  template <typename U> friend class ObjectPtr;

  T* p_ = nullptr;

public:
  using element_type = T;

  ObjectPtr() noexcept = default;
  ObjectPtr(std::nullptr_t) noexcept {}

  // Adopts p and takes a reference on it.
  explicit ObjectPtr(T* p) noexcept
      : p_(p)
  {
    if (p_)
      p_->add_ref();
  }

  ObjectPtr(const ObjectPtr& other) noexcept
      : ObjectPtr(other.p_)
  {
  }

  ObjectPtr(ObjectPtr&& other) noexcept
      : p_(std::exchange(other.p_, nullptr))
  {
  }

  template <typename U>
    requires std::is_convertible_v<U*, T*>
  ObjectPtr(const ObjectPtr<U>& other) noexcept
      : ObjectPtr(static_cast<T*>(other.p_))
  {
  }

  template <typename U>
    requires std::is_convertible_v<U*, T*>
  ObjectPtr(ObjectPtr<U>&& other) noexcept
      : p_(std::exchange(other.p_, nullptr))
  {
  }

  ObjectPtr& operator=(ObjectPtr other) noexcept
  {
    std::swap(p_, other.p_);
    return *this;
  }

  ~ObjectPtr()
  {
    if (p_)
      p_->release();
  }

  T* get() const noexcept { return p_; }
  T* operator->() const noexcept { return p_; }
  T& operator*() const noexcept { return *p_; }
  explicit operator bool() const noexcept { return p_ != nullptr; }

  void reset() noexcept { ObjectPtr().swap(*this); }
  void swap(ObjectPtr& other) noexcept { std::swap(p_, other.p_); }

  friend bool operator==(const ObjectPtr& a, const ObjectPtr& b) noexcept
  {
    return a.p_ == b.p_;
  }
};

template <typename T, typename... Args> ObjectPtr<T> make_object(Args&&... args)
{
  static_assert(std::is_base_of_v<Object, T>,
                "exported objects must derive from npbridge::Object");
  return ObjectPtr<T>(new T(std::forward<Args>(args)...));
}

// Attempts a checked downcast; returns an empty pointer on mismatch.
template <typename T> ObjectPtr<T> object_cast(const ObjectPtr<Object>& obj)
{
  return ObjectPtr<T>(dynamic_cast<T*>(obj.get()));
}

} // namespace npbridge
