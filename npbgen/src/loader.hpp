// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <filesystem>
#include <istream>

#include "ast.hpp"
#include "errors.hpp"

namespace npbgen {

// Reads a JSON declaration file into ctx.module.
// Throws declaration_error.
void load_declarations(Context& ctx);

// Same, from an already opened stream; ctx.file_path() is used in errors.
void load_declarations(Context& ctx, std::istream& is);

} // namespace npbgen
