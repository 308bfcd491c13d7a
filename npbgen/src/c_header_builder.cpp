// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <fstream>

#include "c_header_builder.hpp"

namespace npbgen::builders {

CHeaderBuilder::CHeaderBuilder(Context* ctx, std::filesystem::path out_path)
    : Builder(ctx)
    , out_path_(std::move(out_path))
{
}

void CHeaderBuilder::emit_module_begin() {}

void CHeaderBuilder::emit_export(const ExportedSignature& sig)
{
  oc_ << "// " << sig.qualified_name << "\n";
  oc_ << "NPBRIDGE_IMPORT_ATTR " << invoke_prototype(sig) << ";\n";
  if (sig.is_async) {
    oc_ << "NPBRIDGE_IMPORT_ATTR " << poll_prototype(sig.poll_symbol, sig)
        << ";\n";
    oc_ << "NPBRIDGE_IMPORT_ATTR " << release_prototype(sig.release_symbol)
        << ";\n";

    if (combos_.insert(sig.combo).second) {
      ocombos_ << "NPBRIDGE_IMPORT_ATTR "
               << poll_prototype(combo_poll_symbol(sig.module, sig.combo), sig)
               << ";\n";
      ocombos_ << "NPBRIDGE_IMPORT_ATTR "
               << release_prototype(
                      combo_release_symbol(sig.module, sig.combo))
               << ";\n";
    }
  }
  oc_ << "\n";
}

void CHeaderBuilder::emit_module_end() {}

std::string CHeaderBuilder::str() const
{
  std::stringstream os;
  os << "// Generated by npbgen from " << ctx_->file_path().filename().string()
     << ". Do not edit.\n\n"
     << "#pragma once\n\n"
     << "#include <stdbool.h>\n"
     << "#include <stdint.h>\n\n"
     << "#include <npbridge/abi.h>\n\n"
     << "#ifdef __cplusplus\n"
     << "extern \"C\" {\n"
     << "#endif\n\n"
     << "// Shared poll/release entries, one pair per result shape.\n"
     << ocombos_.str() << "\n"
     << oc_.str()
     << "#ifdef __cplusplus\n"
     << "} // extern \"C\"\n"
     << "#endif\n";
  return os.str();
}

void CHeaderBuilder::finalize()
{
  auto path = out_path_ / (ctx_->module.name + ".h");
  std::ofstream ofs(path);
  if (!ofs)
    throw std::runtime_error("cannot write " + path.string());
  ofs << str();
}

} // namespace npbgen::builders
