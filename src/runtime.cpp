// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <npbridge/config.hpp>
#include <npbridge/executor.hpp>
#include <npbridge/metadata.hpp>

#include "logging.hpp"

namespace npbridge {

void RuntimeBuilder::build()
{
  Executors::instance().configure(cfg_);
  impl::get_logger()->set_level(cfg_.log_level);
  MetadataRegistry::instance().freeze();

  NPBRIDGE_LOG_INFO("runtime initialized: default_threads={}, io_threads={}, "
                    "extra executors={}",
                    cfg_.default_threads, cfg_.io_threads,
                    cfg_.executors.size());
}

} // namespace npbridge
