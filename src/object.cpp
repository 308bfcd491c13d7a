// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <typeinfo>

#include <boost/core/demangle.hpp>

#include <npbridge/impl/object_registry.hpp>
#include <npbridge/object.hpp>

#include "logging.hpp"

namespace npbridge {

std::string Object::class_name() const
{
  return boost::core::demangle(typeid(*this).name());
}

namespace impl {

ObjectRegistry& ObjectRegistry::instance()
{
  static ObjectRegistry registry;
  return registry;
}

uint64_t ObjectRegistry::lower(ObjectPtr<Object> obj)
{
  auto name = obj->class_name();
  auto handle = map_.add(Entry{std::move(obj), 1});
  NPBRIDGE_LOG_TRACE("object {} lowered as handle {:#x}", name, handle);
  return handle;
}

void ObjectRegistry::acquire(uint64_t handle)
{
  bool found = map_.with(handle, [](Entry& e) { ++e.foreign_refs; });
  if (!found)
    throw ConversionFault("dangling object handle");
}

void ObjectRegistry::release(uint64_t handle)
{
  bool found = map_.update_or_remove(
      handle, [](Entry& e) { return --e.foreign_refs == 0; });
  if (!found)
    throw ConversionFault("dangling object handle");
  NPBRIDGE_LOG_TRACE("object handle {:#x} released", handle);
}

} // namespace impl
} // namespace npbridge
