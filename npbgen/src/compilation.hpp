// Copyright (c) 2025 nikitapnn1@gmail.com
// This file is a part of npsystem (Distributed Control System) and covered by LICENSING file in the topmost directory

#pragma once

#include <filesystem>
#include <memory>
#include <vector>

#include "errors.hpp"

namespace npbgen {

class ICompilation {
  friend class CompilationBuilder;
  std::unique_ptr<struct Compilation> impl_;
public:
  ~ICompilation();
  // Throws declaration_error / classification_error on the first bad file.
  void compile();
};

class CompilationBuilder {
public:
  CompilationBuilder& set_input_files(const std::vector<std::filesystem::path>& input_files);
  CompilationBuilder& set_output_dir(const std::filesystem::path& output_dir);
  CompilationBuilder& with_cpp_scaffolding();
  CompilationBuilder& with_c_header();
  CompilationBuilder& with_metadata();
  std::unique_ptr<ICompilation> build();
private:
  enum OutputFlags {
    None         = 0x00, // classification only
    CppScaffold  = 0x01, // <module>_scaffolding.cpp
    CHeader      = 0x02, // <module>.h
    Metadata     = 0x04, // <module>.metadata.json
  };

  int output_flags_ = None;
  std::filesystem::path output_dir_;
  std::vector<std::filesystem::path> input_files_;
};

} // namespace npbgen
