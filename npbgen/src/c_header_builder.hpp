// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <filesystem>
#include <set>
#include <sstream>
#include "builder.hpp"

namespace npbgen::builders {

// Emits <module>.h with the prototype of every boundary entry, for foreign
// adapters and C callers.
class CHeaderBuilder : public Builder {
  std::filesystem::path out_path_;
  std::stringstream oc_;
  std::stringstream ocombos_;
  std::set<std::string> combos_;
public:
  void emit_module_begin() override;
  void emit_export(const ExportedSignature& sig) override;
  void emit_module_end() override;
  void finalize() override;
  Builder* clone(Context* ctx) const override {
    return new CHeaderBuilder(ctx, out_path_);
  }

  std::string str() const;

  CHeaderBuilder(Context* ctx, std::filesystem::path out_path);
};

} // namespace npbgen::builders
