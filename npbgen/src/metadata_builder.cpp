// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <fstream>

#include "metadata_builder.hpp"
#include "types.hpp"

namespace npbgen::builders {

MetadataBuilder::MetadataBuilder(Context* ctx, std::filesystem::path out_path)
    : Builder(ctx)
    , out_path_(std::move(out_path))
{
}

void MetadataBuilder::emit_module_begin()
{
  record_ = {};
  record_.version = version;
  record_.module = ctx_->module.name;
}

void MetadataBuilder::emit_export(const ExportedSignature& sig)
{
  ExportRecord e;
  e.name = sig.name;
  e.receiver = sig.receiver ? sig.receiver->name : "";
  for (const auto& p : sig.params)
    e.params.push_back({p.name, canonical_name(p.type)});
  e.success_type = canonical_name(sig.success);
  e.error_type = sig.error ? canonical_name(sig.error) : "";
  e.async = sig.is_async;
  e.executor = sig.executor;
  e.invoke_symbol = sig.invoke_symbol;
  if (sig.is_async) {
    e.poll_symbol = sig.poll_symbol;
    e.release_symbol = sig.release_symbol;
  }
  record_.exports.push_back(std::move(e));
}

void MetadataBuilder::emit_module_end() {}

void MetadataBuilder::finalize()
{
  auto json = glz::write_json(record_);
  if (!json)
    throw std::runtime_error("cannot serialize metadata of module " +
                             record_.module);

  auto path = out_path_ / (ctx_->module.name + ".metadata.json");
  std::ofstream ofs(path);
  if (!ofs)
    throw std::runtime_error("cannot write " + path.string());
  ofs << glz::prettify_json(*json) << '\n';
}

} // namespace npbgen::builders
