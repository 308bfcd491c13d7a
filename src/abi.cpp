// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <limits>

#include <npbridge/abi.h>
#include <npbridge/call.hpp>
#include <npbridge/converter.hpp>
#include <npbridge/flat_buffer.hpp>
#include <npbridge/impl/object_registry.hpp>
#include <npbridge/metadata.hpp>

#include "logging.hpp"

using namespace npbridge;

namespace {
npbridge_buffer lower_metadata(const ExportMetadata& md)
{
  return lower_into_buffer(md);
}

std::string lift_name(npbridge_buffer rb, std::string_view arg)
{
  return lift_arg<std::string>(arg, rb);
}
} // namespace

extern "C" {

NPBRIDGE_API npbridge_buffer npbridge_buffer_alloc(uint64_t size,
                                                   npbridge_call_status* status)
{
  return call_with_output(status, [&] {
    flat_buffer buf(static_cast<std::size_t>(size));
    return buf.release();
  });
}

NPBRIDGE_API npbridge_buffer npbridge_buffer_from_bytes(
    const uint8_t* data, uint64_t len, npbridge_call_status* status)
{
  return call_with_output(status, [&] {
    if (!data && len)
      throw ConversionFault("null data with nonzero length");
    flat_buffer buf(static_cast<std::size_t>(len));
    buf.append(data, static_cast<std::size_t>(len));
    return buf.release();
  });
}

NPBRIDGE_API npbridge_buffer npbridge_buffer_reserve(
    npbridge_buffer rb, uint64_t additional, npbridge_call_status* status)
{
  return call_with_output(status, [&] {
    flat_buffer::check(rb);
    if (rb.capacity - rb.len >= additional)
      return rb;
    if (additional > std::numeric_limits<std::size_t>::max() - rb.len)
      throw Exception("buffer capacity overflow");

    // rb stays with the caller until the new allocation succeeded.
    flat_buffer grown(static_cast<std::size_t>(rb.len + additional));
    grown.append(rb.data, static_cast<std::size_t>(rb.len));
    flat_buffer::adopt(rb);
    return grown.release();
  });
}

NPBRIDGE_API void npbridge_buffer_free(npbridge_buffer rb,
                                       npbridge_call_status* status)
{
  call_with_output(status, [&] { flat_buffer::adopt(rb); });
}

NPBRIDGE_API void npbridge_object_acquire(npbridge_object_handle handle,
                                          npbridge_call_status* status)
{
  call_with_output(status,
                   [&] { impl::ObjectRegistry::instance().acquire(handle); });
}

NPBRIDGE_API void npbridge_object_release(npbridge_object_handle handle,
                                          npbridge_call_status* status)
{
  call_with_output(status,
                   [&] { impl::ObjectRegistry::instance().release(handle); });
}

NPBRIDGE_API uint32_t npbridge_metadata_version(void)
{
  return MetadataRegistry::version;
}

NPBRIDGE_API uint32_t npbridge_metadata_count(npbridge_call_status* status)
{
  return call_with_output(status, [&] {
    return static_cast<uint32_t>(MetadataRegistry::instance().size());
  });
}

NPBRIDGE_API npbridge_buffer npbridge_metadata_get(uint32_t index,
                                                   npbridge_call_status* status)
{
  return call_with_output(status, [&] {
    auto md = MetadataRegistry::instance().at(index);
    if (!md)
      throw Exception("metadata index out of range: " + std::to_string(index));
    return lower_metadata(*md);
  });
}

NPBRIDGE_API npbridge_buffer npbridge_metadata_find(
    npbridge_buffer module, npbridge_buffer name, npbridge_call_status* status)
{
  return call_with_output(status, [&] {
    auto module_name = lift_name(module, "module");
    auto export_name = lift_name(name, "name");
    auto md = MetadataRegistry::instance().find(module_name, export_name);
    if (!md) {
      NPBRIDGE_LOG_DEBUG("no export {}::{}", module_name, export_name);
      return npbridge_buffer{0, 0, nullptr};
    }
    return lower_metadata(*md);
  });
}

} // extern "C"
