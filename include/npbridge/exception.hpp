// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <stdexcept>
#include <string>

#include <npbridge/export.hpp>

namespace npbridge {
class NPBRIDGE_API Exception : public std::runtime_error
{
public:
  explicit Exception(char const* const msg) noexcept : std::runtime_error(msg)
  {
  }

  explicit Exception(std::string const& msg) noexcept : std::runtime_error(msg)
  {
  }
};

// Malformed ABI value encountered while lifting.
class NPBRIDGE_API ConversionFault : public Exception
{
public:
  using Exception::Exception;
};

// Invariant violation inside native code. Never delivered as a typed error.
class NPBRIDGE_API UnrecoverableFault : public Exception
{
public:
  using Exception::Exception;
};

[[noreturn]] inline void panic(std::string const& msg)
{
  throw UnrecoverableFault(msg);
}
} // namespace npbridge
