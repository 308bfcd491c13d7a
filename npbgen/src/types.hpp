// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <string>
#include <string_view>

#include "ast.hpp"

namespace npbgen {

// Spelling used in declaration files and metadata, e.g. sequence<i32>.
std::string canonical_name(const AstTypeDecl* type);

// Native C++ type, e.g. std::vector<int32_t>.
std::string cpp_type(const AstTypeDecl* type);

// C type that carries the value across the boundary at top level.
// Void maps to "void"; use abi_slot_type for poll output slots.
std::string abi_type(const AstTypeDecl* type);

// Output slot of a poll entry; void results fill an int8_t.
std::string abi_slot_type(const AstTypeDecl* type);

// Turns a canonical name into an identifier fragment:
// "sequence<i32>" -> "sequence_i32", "record:a::B" -> "record_a_B".
std::string mangle(std::string_view canonical);

// Parses a canonical type string. Returns nullptr for an unknown spelling.
AstTypeDecl* parse_type(Context& ctx, std::string_view str);

} // namespace npbgen
