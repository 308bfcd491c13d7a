// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <npbridge/call.hpp>
#include <npbridge/flat_buffer.hpp>

#include "logging.hpp"

namespace npbridge::impl {

void set_success(npbridge_call_status* status) noexcept
{
  status->code = NPBRIDGE_CALL_SUCCESS;
  status->payload = npbridge_buffer{0, 0, nullptr};
}

void set_fault(npbridge_call_status* status,
               std::string_view diagnostic) noexcept
{
  status->code = NPBRIDGE_CALL_UNRECOVERABLE_FAULT;
  status->payload = npbridge_buffer{0, 0, nullptr};
  try {
    NPBRIDGE_LOG_ERROR("unrecoverable fault: {}", diagnostic);
    flat_buffer buf(diagnostic.size());
    buf.append(diagnostic.data(), diagnostic.size());
    status->payload = buf.release();
  } catch (const std::bad_alloc&) {
    // The code alone still reports the fault.
  }
}

void log_entry(std::string_view name)
{
  NPBRIDGE_LOG_DEBUG("{}", name);
}

std::string describe_current_exception() noexcept
{
  try {
    throw;
  } catch (const ConversionFault& ex) {
    return ex.what();
  } catch (const UnrecoverableFault& ex) {
    return std::string("panic: ") + ex.what();
  } catch (const std::exception& ex) {
    return ex.what();
  } catch (...) {
    return "unknown exception";
  }
}

} // namespace npbridge::impl
