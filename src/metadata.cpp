// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <algorithm>

#include <npbridge/exception.hpp>
#include <npbridge/metadata.hpp>

#include "logging.hpp"

namespace npbridge {

namespace {
std::string display_name(const ExportMetadata& md)
{
  return md.receiver.empty() ? md.module + "::" + md.name
                             : md.module + "::" + md.receiver + "::" + md.name;
}
} // namespace

MetadataRegistry& MetadataRegistry::instance()
{
  static MetadataRegistry registry;
  return registry;
}

void MetadataRegistry::add(ExportMetadata md)
{
  std::lock_guard<std::mutex> lk(mutex_);
  if (frozen_)
    throw Exception("metadata registry is frozen; cannot add '" +
                    display_name(md) + "'");
  auto dup = std::find_if(exports_.begin(), exports_.end(), [&](auto& e) {
    return e.module == md.module && e.receiver == md.receiver &&
           e.name == md.name;
  });
  if (dup != exports_.end())
    throw Exception("duplicate export '" + display_name(md) + "'");
  exports_.push_back(std::move(md));
}

void MetadataRegistry::register_static(ExportMetadata md) noexcept
{
  try {
    add(std::move(md));
  } catch (const std::exception& ex) {
    NPBRIDGE_LOG_ERROR("export not registered: {}", ex.what());
  }
}

void MetadataRegistry::freeze() noexcept
{
  std::lock_guard<std::mutex> lk(mutex_);
  if (!frozen_)
    NPBRIDGE_LOG_DEBUG("metadata registry frozen with {} exports",
                       exports_.size());
  frozen_ = true;
}

bool MetadataRegistry::frozen() const noexcept
{
  std::lock_guard<std::mutex> lk(mutex_);
  return frozen_;
}

std::size_t MetadataRegistry::size()
{
  std::lock_guard<std::mutex> lk(mutex_);
  frozen_ = true;
  return exports_.size();
}

std::optional<ExportMetadata> MetadataRegistry::at(std::size_t index)
{
  std::lock_guard<std::mutex> lk(mutex_);
  frozen_ = true;
  if (index >= exports_.size())
    return std::nullopt;
  return exports_[index];
}

std::optional<ExportMetadata> MetadataRegistry::find(std::string_view module,
                                                     std::string_view name)
{
  std::string_view receiver;
  if (auto sep = name.rfind("::"); sep != std::string_view::npos) {
    receiver = name.substr(0, sep);
    name = name.substr(sep + 2);
  }

  std::lock_guard<std::mutex> lk(mutex_);
  frozen_ = true;
  for (const auto& e : exports_) {
    if (e.module == module && e.receiver == receiver && e.name == name)
      return e;
  }
  return std::nullopt;
}

} // namespace npbridge
