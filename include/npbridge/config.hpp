// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/any_io_executor.hpp>

#include <npbridge/export.hpp>

namespace npbridge {

enum class LogLevel : uint32_t {
  trace = 0,
  debug = 1,
  info = 2,
  warn = 3,
  error = 4,
  critical = 5,
  off = 6
};

struct Config {
  LogLevel log_level = LogLevel::info;
  // Worker threads of the default executor.
  uint32_t default_threads = 4;
  // Threads running the io executor.
  uint32_t io_threads = 1;
  // Additional named executors selectable by the executor directive.
  std::vector<std::pair<std::string, boost::asio::any_io_executor>> executors;
};

// Applies configuration once, before the first asynchronous export runs.
// When it is never used the defaults above apply on first use.
class NPBRIDGE_API RuntimeBuilder
{
  Config cfg_;

public:
  RuntimeBuilder& with_log_level(LogLevel level)
  {
    cfg_.log_level = level;
    return *this;
  }

  RuntimeBuilder& with_default_threads(uint32_t n)
  {
    cfg_.default_threads = n;
    return *this;
  }

  RuntimeBuilder& with_io_threads(uint32_t n)
  {
    cfg_.io_threads = n;
    return *this;
  }

  RuntimeBuilder& with_executor(std::string name,
                                boost::asio::any_io_executor ex)
  {
    cfg_.executors.emplace_back(std::move(name), std::move(ex));
    return *this;
  }

  const Config& config() const noexcept { return cfg_; }

  /// Throws npbridge::Exception when the runtime was already initialized or
  /// an executor has already been started with the defaults.
  void build();
};

} // namespace npbridge
