// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include "logging.hpp"

#include <cstdlib>
#include <string_view>

namespace npbridge::impl {

namespace {
// NPBRIDGE_LOG_LEVEL=trace|debug|info|warn|error|critical|off
LogLevel initial_level()
{
  const char* env = std::getenv("NPBRIDGE_LOG_LEVEL");
  if (!env)
    return LogLevel::info;
  std::string_view v(env);
  if (v == "trace")
    return LogLevel::trace;
  if (v == "debug")
    return LogLevel::debug;
  if (v == "warn")
    return LogLevel::warn;
  if (v == "error")
    return LogLevel::error;
  if (v == "critical")
    return LogLevel::critical;
  if (v == "off")
    return LogLevel::off;
  return LogLevel::info;
}
} // namespace

std::shared_ptr<SimpleLogger>& get_logger()
{
  static std::shared_ptr<SimpleLogger> logger =
      std::make_shared<SimpleLogger>("npbridge", initial_level());
  return logger;
}

} // namespace npbridge::impl
