// Copyright (c) 2025 nikitapnn1@gmail.com
// This file is a part of npsystem (Distributed Control System) and covered by LICENSING file in the topmost directory

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace npbgen {

// Malformed declaration file: bad JSON, missing field, unknown type string.
class declaration_error : public std::runtime_error {
public:
  const std::string file_path;
  const std::string declaration;

  declaration_error(std::string_view _file_path, std::string_view _declaration, const std::string& msg)
    : std::runtime_error(msg), file_path(_file_path), declaration(_declaration) {}
};

// Well-formed declaration that cannot be exported across the boundary.
class classification_error : public declaration_error {
public:
  classification_error(std::string_view _file_path, std::string_view _declaration, const std::string& msg)
    : declaration_error(_file_path, _declaration, msg) {}
};

} // namespace npbgen
