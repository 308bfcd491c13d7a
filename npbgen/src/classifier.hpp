// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <vector>

#include "ast.hpp"
#include "errors.hpp"
#include "signature.hpp"

namespace npbgen {

// Determines the calling shape of one declaration. owner is the object whose
// method block holds fn, or nullptr for a free function.
// Throws classification_error.
ExportedSignature classify(const Context& ctx, const AstFunctionDecl* fn,
                           const AstObjectDecl* owner);

// Classifies every export of the module in declaration order: free functions
// first, then methods object by object.
std::vector<ExportedSignature> classify_module(const Context& ctx);

} // namespace npbgen
