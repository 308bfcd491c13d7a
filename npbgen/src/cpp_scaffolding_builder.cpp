// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <fstream>

#include "cpp_scaffolding_builder.hpp"
#include "types.hpp"

namespace npbgen::builders {

namespace {
std::string quoted(std::string_view s)
{
  std::string out = "\"";
  for (char c : s) {
    if (c == '"' || c == '\\')
      out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}
} // namespace

CppScaffoldingBuilder::CppScaffoldingBuilder(Context* ctx,
                                             std::filesystem::path out_path)
    : Builder(ctx)
    , out_path_(std::move(out_path))
{
}

std::string CppScaffoldingBuilder::error_type(
    const ExportedSignature& sig) const
{
  return sig.error ? cpp_type(sig.error) : "npbridge::NoError";
}

void CppScaffoldingBuilder::emit_module_begin()
{
  oregistry_ << "namespace {\n";
}

void CppScaffoldingBuilder::emit_metadata_registrar(
    const ExportedSignature& sig)
{
  auto& os = oregistry_;
  os << "const npbridge::MetadataRegistrar npbgen_export_" << export_n_++
     << "{npbridge::ExportMetadata{\n";
  ++block_depth_;
  os << bl() << quoted(sig.module) << ",\n"
     << bl() << quoted(sig.name) << ",\n"
     << bl() << quoted(sig.receiver ? sig.receiver->name : "") << ",\n"
     << bl() << "{";
  for (size_t i = 0; i < sig.params.size(); ++i) {
    if (i)
      os << ", ";
    os << "{" << quoted(sig.params[i].name) << ", "
       << quoted(canonical_name(sig.params[i].type)) << "}";
  }
  os << "},\n"
     << bl() << quoted(canonical_name(sig.success)) << ",\n"
     << bl() << quoted(sig.error ? canonical_name(sig.error) : "") << ",\n"
     << bl() << (sig.is_async ? "true" : "false") << ",\n"
     << bl() << quoted(sig.executor) << ",\n"
     << bl() << quoted(sig.invoke_symbol) << ",\n"
     << bl() << quoted(sig.poll_symbol) << ",\n"
     << bl() << quoted(sig.release_symbol) << "}};\n";
  --block_depth_;
}

void CppScaffoldingBuilder::emit_lift_arguments(const ExportedSignature& sig,
                                                std::ostream& os)
{
  if (sig.receiver) {
    os << bl() << "auto arg_self = npbridge::lift_arg<npbridge::ObjectPtr<"
       << sig.receiver->cpp_name << ">>(\"self\", self);\n";
  }
  for (const auto& p : sig.params) {
    os << bl() << "auto arg_" << p.name << " = npbridge::lift_arg<"
       << cpp_type(p.type) << ">(" << quoted(p.name) << ", " << p.name
       << ");\n";
  }
}

// Direct call of the native function with the lifted locals.
std::string CppScaffoldingBuilder::native_call(
    const ExportedSignature& sig) const
{
  std::string call = sig.receiver
                         ? "arg_self->" + sig.name + "("
                         : ctx_->module.cpp_namespace + "::" + sig.name + "(";
  for (size_t i = 0; i < sig.params.size(); ++i) {
    if (i)
      call += ", ";
    call += "std::move(arg_" + sig.params[i].name + ")";
  }
  call += ")";
  return call;
}

void CppScaffoldingBuilder::emit_sync_entry(const ExportedSignature& sig)
{
  auto& os = oentries_;
  const bool returns_void = sig.success->id == FieldType::Void;

  os << "NPBRIDGE_EXPORT_ATTR " << invoke_prototype(sig) << "\n" << bb();
  os << bl() << (returns_void ? "" : "return ")
     << "npbridge::call_with_result<" << error_type(sig)
     << ">(npb_status, [&] {\n";
  ++block_depth_;
  os << bl() << "npbridge::impl::log_entry(" << quoted(sig.qualified_name)
     << ");\n";
  emit_lift_arguments(sig, os);
  if (returns_void) {
    os << bl() << native_call(sig) << ";\n";
  } else {
    os << bl() << "return npbridge::FfiConverter<" << cpp_type(sig.success)
       << ">::lower(" << native_call(sig) << ");\n";
  }
  --block_depth_;
  os << bl() << "});\n" << eb() << "\n";
}

void CppScaffoldingBuilder::emit_async_entries(const ExportedSignature& sig)
{
  auto& os = oentries_;

  os << "NPBRIDGE_EXPORT_ATTR " << invoke_prototype(sig) << "\n" << bb();
  os << bl() << "return npbridge::call_with_output(npb_status, [&] {\n";
  ++block_depth_;
  os << bl() << "npbridge::impl::log_entry(" << quoted(sig.qualified_name)
     << ");\n";
  emit_lift_arguments(sig, os);

  // The native body runs inside a bridge frame that owns the arguments.
  os << bl() << "return npbridge::start_future<" << cpp_type(sig.success)
     << ", " << error_type(sig) << ">(\n";
  ++block_depth_;
  ++block_depth_;
  os << bl() << "npbridge::Executors::instance().get("
     << quoted(sig.executor) << "),\n";
  if (sig.receiver) {
    os << bl() << "[](auto& self, auto&... args) { return self->" << sig.name
       << "(std::move(args)...); }";
    os << ",\n" << bl() << "std::move(arg_self)";
  } else {
    os << bl() << "[](auto&... args) { return " << ctx_->module.cpp_namespace
       << "::" << sig.name << "(std::move(args)...); }";
  }
  for (const auto& p : sig.params)
    os << ",\n" << bl() << "std::move(arg_" << p.name << ")";
  os << ");\n";
  --block_depth_;
  --block_depth_;
  --block_depth_;
  os << bl() << "});\n" << eb() << "\n";

  os << "NPBRIDGE_EXPORT_ATTR " << poll_prototype(sig.poll_symbol, sig) << "\n"
     << bb();
  os << bl() << "return " << combo_poll_symbol(sig.module, sig.combo)
     << "(handle, callback, callback_env, out, npb_status);\n";
  os << eb() << "\n";

  os << "NPBRIDGE_EXPORT_ATTR " << release_prototype(sig.release_symbol)
     << "\n" << bb();
  os << bl() << combo_release_symbol(sig.module, sig.combo)
     << "(handle, npb_status);\n";
  os << eb() << "\n";

  if (combos_.insert(sig.combo).second)
    emit_combo(sig);
}

void CppScaffoldingBuilder::emit_combo(const ExportedSignature& sig)
{
  auto& os = ocombos_;
  auto poll = combo_poll_symbol(sig.module, sig.combo);
  auto release = combo_release_symbol(sig.module, sig.combo);
  auto targs = cpp_type(sig.success) + ", " + error_type(sig);

  os << "NPBRIDGE_EXPORT_ATTR " << poll_prototype(poll, sig) << "\n" << bb();
  os << bl() << "return npbridge::future_poll<" << targs << ">(\n";
  ++block_depth_;
  ++block_depth_;
  os << bl() << quoted(poll) << ", handle, callback, callback_env, out, "
     << "npb_status);\n";
  --block_depth_;
  --block_depth_;
  os << eb() << "\n";

  os << "NPBRIDGE_EXPORT_ATTR " << release_prototype(release) << "\n" << bb();
  os << bl() << "npbridge::future_release<" << targs << ">(" << quoted(release)
     << ", handle, npb_status);\n";
  os << eb() << "\n";
}

void CppScaffoldingBuilder::emit_export(const ExportedSignature& sig)
{
  emit_metadata_registrar(sig);
  if (sig.is_async)
    emit_async_entries(sig);
  else
    emit_sync_entry(sig);
}

void CppScaffoldingBuilder::emit_module_end()
{
  oregistry_ << "} // namespace\n";
}

std::string CppScaffoldingBuilder::str() const
{
  std::stringstream os;
  os << "// Generated by npbgen from " << ctx_->file_path().filename().string()
     << ". Do not edit.\n\n"
     << "#include <npbridge/npbridge.hpp>\n\n"
     << "#include " << quoted(ctx_->module.header) << "\n\n"
     << oregistry_.str() << "\n"
     << "extern \"C\" {\n\n"
     << ocombos_.str() << oentries_.str() << "} // extern \"C\"\n";
  return os.str();
}

void CppScaffoldingBuilder::finalize()
{
  auto path = out_path_ / (ctx_->module.name + "_scaffolding.cpp");
  std::ofstream ofs(path);
  if (!ofs)
    throw std::runtime_error("cannot write " + path.string());
  ofs << str();
}

} // namespace npbgen::builders
