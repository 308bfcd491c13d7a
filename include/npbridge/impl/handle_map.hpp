// Copyright (c) 2021-2025 nikitapnn1@gmail.com
// This file is a part of npsystem (Distributed Control System) and covered by
// LICENSING file in the topmost directory

#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace npbridge::impl {

// Generation-indexed id to value mapping.
// An id is (generation << 32) | index. Removing a value bumps the generation
// of its slot, so ids that outlived their value never resolve again.
// Generations start at 1, which keeps 0 free to mean "null handle".
template <typename T> class HandleMap
{
  static constexpr uint32_t npos = 0xFFFF'FFFFu;

  struct Item {
    uint32_t next = npos;
    uint32_t gix = 1;
    std::optional<T> val;
  };

  std::vector<Item> items_;
  uint32_t free_ix_ = npos;
  std::size_t size_ = 0;
  mutable std::mutex mutex_;

  constexpr static uint32_t index(uint64_t id) noexcept
  {
    return id & 0xFFFF'FFFFull;
  }

  constexpr static uint32_t generation_index(uint64_t id) noexcept
  {
    return (id >> 32) & 0xFFFF'FFFFul;
  }

  Item* find(uint64_t id) noexcept
  {
    const auto idx = index(id);
    if (idx >= items_.size())
      return nullptr;
    auto& item = items_[idx];
    if (!item.val || item.gix != generation_index(id))
      return nullptr;
    return &item;
  }

public:
  uint64_t add(T val)
  {
    std::lock_guard<std::mutex> lk(mutex_);
    uint32_t idx;
    if (free_ix_ != npos) {
      idx = free_ix_;
      free_ix_ = items_[idx].next;
    } else {
      idx = static_cast<uint32_t>(items_.size());
      items_.emplace_back();
    }
    auto& item = items_[idx];
    item.val.emplace(std::move(val));
    item.next = npos;
    ++size_;
    return (static_cast<uint64_t>(item.gix) << 32) | idx;
  }

  // Runs fn on the value under the map lock.
  // Returns false when the id does not resolve.
  template <typename Fn> bool with(uint64_t id, Fn&& fn)
  {
    std::lock_guard<std::mutex> lk(mutex_);
    auto item = find(id);
    if (!item)
      return false;
    fn(*item->val);
    return true;
  }

  // Like with(), but fn decides whether the value should be removed by
  // returning true. The removed value is destroyed after the lock is dropped.
  template <typename Fn> bool update_or_remove(uint64_t id, Fn&& fn)
  {
    std::optional<T> removed;
    {
      std::lock_guard<std::mutex> lk(mutex_);
      auto item = find(id);
      if (!item)
        return false;
      if (fn(*item->val)) {
        removed = std::move(item->val);
        item->val.reset();
        if (++item->gix == 0)
          item->gix = 1;
        item->next = free_ix_;
        free_ix_ = index(id);
        --size_;
      }
    }
    return true;
  }

  std::optional<T> remove(uint64_t id)
  {
    std::optional<T> removed;
    update_or_remove(id, [&](T& val) {
      removed = std::move(val);
      return true;
    });
    return removed;
  }

  bool contains(uint64_t id) const
  {
    std::lock_guard<std::mutex> lk(mutex_);
    return const_cast<HandleMap*>(this)->find(id) != nullptr;
  }

  std::size_t size() const
  {
    std::lock_guard<std::mutex> lk(mutex_);
    return size_;
  }
};

} // namespace npbridge::impl
