// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include "compilation.hpp"
#include "builder.hpp"
#include "c_header_builder.hpp"
#include "classifier.hpp"
#include "cpp_scaffolding_builder.hpp"
#include "loader.hpp"
#include "metadata_builder.hpp"

// Implementation of ICompilation and CompilationBuilder
namespace npbgen {

struct Compilation {
  const builders::BuildGroup build_group_;
  const std::vector<std::filesystem::path> input_files_;

  Compilation(builders::BuildGroup&& build_group,
              std::vector<std::filesystem::path>&& input_files)
      : build_group_(std::move(build_group)),
        input_files_(std::move(input_files))
  {
  }

  void compile()
  {
    for (const auto& file : input_files_) {
      Context ctx(file);
      builders::BuildGroup build_group(build_group_, &ctx);

      load_declarations(ctx);
      // Classify everything before emitting anything, so a bad declaration
      // leaves no partial output behind.
      auto exports = classify_module(ctx);

      build_group.emit(&builders::Builder::emit_module_begin);
      for (const auto& sig : exports)
        build_group.emit(&builders::Builder::emit_export, sig);
      build_group.emit(&builders::Builder::emit_module_end);
      build_group.finalize();
    }
  }
};

ICompilation::~ICompilation() = default;

void ICompilation::compile() { impl_->compile(); }

CompilationBuilder& CompilationBuilder::set_input_files(
    const std::vector<std::filesystem::path>& files)
{
  input_files_ = files;
  return *this;
}

CompilationBuilder&
CompilationBuilder::set_output_dir(const std::filesystem::path& output_dir)
{
  output_dir_ = output_dir;
  return *this;
}

CompilationBuilder& CompilationBuilder::with_cpp_scaffolding()
{
  output_flags_ |= OutputFlags::CppScaffold;
  return *this;
}

CompilationBuilder& CompilationBuilder::with_c_header()
{
  output_flags_ |= OutputFlags::CHeader;
  return *this;
}

CompilationBuilder& CompilationBuilder::with_metadata()
{
  output_flags_ |= OutputFlags::Metadata;
  return *this;
}

std::unique_ptr<ICompilation> CompilationBuilder::build()
{
  builders::BuildGroup builder;
  if (output_flags_ & OutputFlags::CppScaffold)
    builder.add<builders::CppScaffoldingBuilder>(output_dir_);
  if (output_flags_ & OutputFlags::CHeader)
    builder.add<builders::CHeaderBuilder>(output_dir_);
  if (output_flags_ & OutputFlags::Metadata)
    builder.add<builders::MetadataBuilder>(output_dir_);

  auto compilation = std::make_unique<ICompilation>();
  compilation->impl_ = std::make_unique<Compilation>(std::move(builder),
                                                     std::move(input_files_));

  return compilation;
}
} // namespace npbgen
