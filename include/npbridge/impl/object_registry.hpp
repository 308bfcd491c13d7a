// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>

#include <npbridge/exception.hpp>
#include <npbridge/export.hpp>
#include <npbridge/impl/handle_map.hpp>
#include <npbridge/object.hpp>

namespace npbridge::impl {

// Table of objects referenced from the foreign side.
// Each handle carries a count of foreign references; the entry keeps one
// native reference to the object for as long as that count is nonzero.
class NPBRIDGE_API ObjectRegistry
{
  struct Entry {
    ObjectPtr<Object> obj;
    uint32_t foreign_refs;
  };

  HandleMap<Entry> map_;

public:
  static ObjectRegistry& instance();

  // New handle owning one foreign reference.
  uint64_t lower(ObjectPtr<Object> obj);

  // Consumes one foreign reference and returns a native one.
  template <typename T> ObjectPtr<T> take(uint64_t handle)
  {
    if (handle == 0)
      throw ConversionFault("null object handle");

    ObjectPtr<T> result;
    bool type_mismatch = false;
    bool found = map_.update_or_remove(handle, [&](Entry& e) {
      result = object_cast<T>(e.obj);
      if (!result) {
        type_mismatch = true;
        return false;
      }
      return --e.foreign_refs == 0;
    });

    if (!found)
      throw ConversionFault("dangling object handle");
    if (type_mismatch)
      throw ConversionFault("object handle type mismatch");
    return result;
  }

  void acquire(uint64_t handle);
  void release(uint64_t handle);

  bool contains(uint64_t handle) const { return map_.contains(handle); }
  std::size_t size() const { return map_.size(); }
};

} // namespace npbridge::impl
