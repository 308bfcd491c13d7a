// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <glaze/glaze.hpp>

#include "builder.hpp"

namespace npbgen::builders {

struct ParamRecord {
  std::string name;
  std::string type;
};

struct ExportRecord {
  std::string name;
  std::string receiver;
  std::vector<ParamRecord> params;
  std::string success_type;
  std::string error_type;
  bool async = false;
  std::string executor;
  std::string invoke_symbol;
  // async exports only
  std::optional<std::string> poll_symbol;
  std::optional<std::string> release_symbol;
};

struct ModuleRecord {
  int version = 0;
  std::string module;
  std::vector<ExportRecord> exports;
};

// Emits <module>.metadata.json, the language-agnostic description of every
// export that per-language adapters are generated from.
class MetadataBuilder : public Builder {
  std::filesystem::path out_path_;
  ModuleRecord record_;
public:
  static constexpr int version = 1;

  void emit_module_begin() override;
  void emit_export(const ExportedSignature& sig) override;
  void emit_module_end() override;
  void finalize() override;
  Builder* clone(Context* ctx) const override {
    return new MetadataBuilder(ctx, out_path_);
  }

  const ModuleRecord& record() const noexcept { return record_; }

  MetadataBuilder(Context* ctx, std::filesystem::path out_path);
};

} // namespace npbgen::builders

template <>
struct glz::meta<npbgen::builders::ParamRecord> {
  using T = npbgen::builders::ParamRecord;
  static constexpr auto value = object(
    "name", &T::name,
    "type", &T::type
  );
};

template <>
struct glz::meta<npbgen::builders::ExportRecord> {
  using T = npbgen::builders::ExportRecord;
  static constexpr auto value = object(
    "name", &T::name,
    "receiver", &T::receiver,
    "params", &T::params,
    "success_type", &T::success_type,
    "error_type", &T::error_type,
    "async", &T::async,
    "executor", &T::executor,
    "invoke_symbol", &T::invoke_symbol,
    "poll_symbol", &T::poll_symbol,
    "release_symbol", &T::release_symbol
  );
};

template <>
struct glz::meta<npbgen::builders::ModuleRecord> {
  using T = npbgen::builders::ModuleRecord;
  static constexpr auto value = object(
    "version", &T::version,
    "module", &T::module,
    "exports", &T::exports
  );
};
