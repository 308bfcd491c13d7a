// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/fusion/include/adapt_struct.hpp>

#include <npbridge/export.hpp>

namespace npbridge {

struct ParamMetadata {
  std::string name;
  std::string type;
};

// Description of one boundary entry, as emitted by npbgen.
// Empty receiver means a free function; empty error_type means no declared
// error; empty poll/release symbols mean a synchronous export.
struct ExportMetadata {
  std::string module;
  std::string name;
  std::string receiver;
  std::vector<ParamMetadata> params;
  std::string success_type;
  std::string error_type;
  bool is_async = false;
  std::string executor;
  std::string invoke_symbol;
  std::string poll_symbol;
  std::string release_symbol;
};

} // namespace npbridge

BOOST_FUSION_ADAPT_STRUCT(npbridge::ParamMetadata, name, type)

BOOST_FUSION_ADAPT_STRUCT(npbridge::ExportMetadata, module, name, receiver,
                          params, success_type, error_type, is_async, executor,
                          invoke_symbol, poll_symbol, release_symbol)

namespace npbridge {

class NPBRIDGE_API MetadataRegistry
{
  mutable std::mutex mutex_;
  std::vector<ExportMetadata> exports_;
  bool frozen_ = false;

public:
  static constexpr uint32_t version = 1;

  // Process-wide registry filled by generated scaffolding.
  static MetadataRegistry& instance();

  /// Throws npbridge::Exception once the registry is frozen or when an
  /// export with the same module, receiver and name is already registered.
  void add(ExportMetadata md);

  // Same as add(), but logs the rejection instead of throwing.
  void register_static(ExportMetadata md) noexcept;

  void freeze() noexcept;
  bool frozen() const noexcept;

  // Reads freeze the registry.
  std::size_t size();
  std::optional<ExportMetadata> at(std::size_t index);
  // Methods are looked up as "Object::method".
  std::optional<ExportMetadata> find(std::string_view module,
                                     std::string_view name);
};

// Generated scaffolding defines one static registrar per export.
struct MetadataRegistrar {
  explicit MetadataRegistrar(ExportMetadata md)
  {
    MetadataRegistry::instance().register_static(std::move(md));
  }
};

} // namespace npbridge
