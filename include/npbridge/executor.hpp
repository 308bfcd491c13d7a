// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

#include <npbridge/config.hpp>
#include <npbridge/export.hpp>

namespace npbridge {

inline constexpr std::string_view default_executor_name = "default";
inline constexpr std::string_view io_executor_name = "io";

// Process-wide table of native schedulers an asynchronous export can run on.
// Built-in executors are created on first use and live for the rest of the
// process; the table is not modified after that.
class NPBRIDGE_API Executors
{
  struct IoRunner {
    boost::asio::io_context ioc;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
        work_guard;
    boost::asio::thread_pool pool;

    explicit IoRunner(uint32_t threads);
    ~IoRunner();
  };

  mutable std::mutex mutex_;
  Config cfg_;
  bool configured_ = false;
  bool started_ = false;
  std::unique_ptr<boost::asio::thread_pool> pool_;
  std::unique_ptr<IoRunner> io_;
  std::map<std::string, boost::asio::any_io_executor, std::less<>> named_;

  Executors();

public:
  static Executors& instance();

  /// "" selects the default executor.
  /// Throws npbridge::Exception for an unknown name.
  boost::asio::any_io_executor get(std::string_view name);

  boost::asio::any_io_executor default_executor()
  {
    return get(default_executor_name);
  }

  void configure(const Config& cfg);

  bool started() const;

  ~Executors();
};

} // namespace npbridge
