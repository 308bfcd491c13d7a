// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <boost/asio/post.hpp>

#include <npbridge/exception.hpp>
#include <npbridge/executor.hpp>

#include "logging.hpp"

namespace npbridge {

Executors::IoRunner::IoRunner(uint32_t threads)
    : work_guard(boost::asio::make_work_guard(ioc))
    , pool(threads)
{
  for (uint32_t i = 0; i < threads; ++i)
    boost::asio::post(pool, [this] { ioc.run(); });
}

Executors::IoRunner::~IoRunner()
{
  work_guard.reset();
  ioc.stop();
  pool.join();
}

Executors::Executors()
{
  // The logger must outlive the worker threads joined in the destructor.
  impl::get_logger();
}

Executors::~Executors()
{
  // Outstanding native bodies are abandoned at process exit.
  io_.reset();
  if (pool_) {
    pool_->stop();
    pool_->join();
  }
}

Executors& Executors::instance()
{
  static Executors executors;
  return executors;
}

void Executors::configure(const Config& cfg)
{
  std::lock_guard<std::mutex> lk(mutex_);
  if (configured_)
    throw Exception("runtime is already configured");
  if (started_)
    throw Exception("runtime configured after the first asynchronous call");
  if (cfg.default_threads == 0 || cfg.io_threads == 0)
    throw Exception("executor thread count must be positive");

  std::map<std::string, boost::asio::any_io_executor, std::less<>> named;
  for (const auto& [name, ex] : cfg.executors) {
    if (name.empty() || name == default_executor_name ||
        name == io_executor_name)
      throw Exception("reserved executor name: '" + name + "'");
    if (!named.emplace(name, ex).second)
      throw Exception("duplicate executor name: '" + name + "'");
  }

  cfg_ = cfg;
  named_ = std::move(named);
  configured_ = true;
}

boost::asio::any_io_executor Executors::get(std::string_view name)
{
  std::lock_guard<std::mutex> lk(mutex_);
  started_ = true;

  if (name.empty() || name == default_executor_name) {
    if (!pool_) {
      NPBRIDGE_LOG_DEBUG("starting default executor with {} threads",
                         cfg_.default_threads);
      pool_ = std::make_unique<boost::asio::thread_pool>(cfg_.default_threads);
    }
    return pool_->get_executor();
  }

  if (name == io_executor_name) {
    if (!io_) {
      NPBRIDGE_LOG_DEBUG("starting io executor with {} threads",
                         cfg_.io_threads);
      io_ = std::make_unique<IoRunner>(cfg_.io_threads);
    }
    return io_->ioc.get_executor();
  }

  if (auto it = named_.find(name); it != named_.end())
    return it->second;

  throw Exception("unknown executor: '" + std::string(name) + "'");
}

bool Executors::started() const
{
  std::lock_guard<std::mutex> lk(mutex_);
  return started_;
}

} // namespace npbridge
