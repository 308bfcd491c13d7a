// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// This file is a part of npsystem (Distributed Control System) and covered by LICENSING file in the topmost directory

#pragma once

#include <filesystem>
#include <set>
#include <sstream>
#include "builder.hpp"

namespace npbgen::builders {

// Emits <module>_scaffolding.cpp: the extern "C" boundary entries of every
// export, the shared poll/release pair of every (success, error)
// combination, and the static registration of export metadata.
class CppScaffoldingBuilder : public Builder {
  std::filesystem::path out_path_;

  std::stringstream oregistry_;
  std::stringstream ocombos_;
  std::stringstream oentries_;

  std::set<std::string> combos_;
  size_t export_n_ = 0;

  void emit_metadata_registrar(const ExportedSignature& sig);
  void emit_sync_entry(const ExportedSignature& sig);
  void emit_async_entries(const ExportedSignature& sig);
  void emit_combo(const ExportedSignature& sig);
  void emit_lift_arguments(const ExportedSignature& sig, std::ostream& os);
  std::string native_call(const ExportedSignature& sig) const;
  std::string error_type(const ExportedSignature& sig) const;
public:
  void emit_module_begin() override;
  void emit_export(const ExportedSignature& sig) override;
  void emit_module_end() override;
  void finalize() override;
  Builder* clone(Context* ctx) const override {
    return new CppScaffoldingBuilder(ctx, out_path_);
  }

  // Generated text, available after emit_module_end().
  std::string str() const;

  CppScaffoldingBuilder(Context* ctx, std::filesystem::path out_path);
};

} // namespace npbgen::builders
