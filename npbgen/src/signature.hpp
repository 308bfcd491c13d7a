// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <string>
#include <vector>

#include "ast.hpp"

namespace npbgen {

inline constexpr std::string_view default_executor = "default";

// Calling shape of one export. Produced by classify() and never modified.
struct ExportedSignature {
  std::string module;
  std::string name;
  // "module::name" or "module::Object::name"
  std::string qualified_name;
  // nullptr for free functions
  const AstObjectDecl* receiver = nullptr;
  // receiver excluded
  std::vector<AstParam> params;
  AstTypeDecl* success;
  AstTypeDecl* error = nullptr;
  bool is_async = false;
  std::string executor;

  std::string invoke_symbol;
  std::string poll_symbol;
  std::string release_symbol;
  // identifies the (success, error) pair; empty for synchronous exports
  std::string combo;
};

std::string combo_name(const AstTypeDecl* success, const AstTypeDecl* error);

std::string combo_poll_symbol(const std::string& module,
                              const std::string& combo);

std::string combo_release_symbol(const std::string& module,
                                 const std::string& combo);

} // namespace npbgen
