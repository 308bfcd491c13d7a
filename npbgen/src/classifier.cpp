// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <unordered_set>

#include "classifier.hpp"
#include "types.hpp"

namespace npbgen {

std::string combo_name(const AstTypeDecl* success, const AstTypeDecl* error)
{
  auto combo = mangle(canonical_name(success));
  if (error)
    combo += "_or_" + mangle(canonical_name(error));
  return combo;
}

std::string combo_poll_symbol(const std::string& module,
                              const std::string& combo)
{
  return "npbridge_" + module + "_future_poll_" + combo;
}

std::string combo_release_symbol(const std::string& module,
                                 const std::string& combo)
{
  return "npbridge_" + module + "_future_release_" + combo;
}

ExportedSignature classify(const Context& ctx, const AstFunctionDecl* fn,
                           const AstObjectDecl* owner)
{
  const auto& module = ctx.module.name;
  ExportedSignature sig;
  sig.module = module;
  sig.name = fn->name;
  sig.qualified_name = owner ? module + "::" + owner->name + "::" + fn->name
                             : module + "::" + fn->name;

  auto fail = [&](const std::string& msg) {
    throw classification_error(ctx.file_path().string(), sig.qualified_name,
                               msg);
  };

  auto is_receiver = [](const AstParam& p) {
    return p.type->id == FieldType::Receiver;
  };

  auto first_receiver =
      std::find_if(fn->params.begin(), fn->params.end(), is_receiver);
  bool has_receiver = first_receiver != fn->params.end();

  if (has_receiver) {
    if (!owner || first_receiver != fn->params.begin() ||
        std::find_if(std::next(first_receiver), fn->params.end(),
                     is_receiver) != fn->params.end())
      fail("misplaced receiver");
  } else if (owner) {
    fail("associated functions unsupported");
  }

  if (fn->executor && !fn->is_async)
    fail("directive only valid on asynchronous exports");

  if (fn->executor && fn->executor->empty())
    fail("empty executor name");

  sig.receiver = owner;
  sig.params.assign(has_receiver ? std::next(fn->params.begin())
                                 : fn->params.begin(),
                    fn->params.end());
  sig.success = fn->ret;
  sig.error = fn->error;
  sig.is_async = fn->is_async;
  sig.executor = fn->is_async
                     ? fn->executor.value_or(std::string(default_executor))
                     : std::string();

  sig.invoke_symbol = owner ? "npbridge_" + module + "_method_" + owner->name +
                                  "_" + fn->name
                            : "npbridge_" + module + "_fn_" + fn->name;
  if (sig.is_async) {
    sig.poll_symbol = sig.invoke_symbol + "_poll";
    sig.release_symbol = sig.invoke_symbol + "_release";
    sig.combo = combo_name(sig.success, sig.error);
  }

  return sig;
}

std::vector<ExportedSignature> classify_module(const Context& ctx)
{
  std::vector<ExportedSignature> result;
  std::unordered_set<std::string> names;

  auto add = [&](const AstFunctionDecl* fn, const AstObjectDecl* owner) {
    auto sig = classify(ctx, fn, owner);
    if (!names.insert(sig.invoke_symbol).second)
      throw classification_error(ctx.file_path().string(), sig.qualified_name,
                                 "duplicate export");
    result.push_back(std::move(sig));
  };

  for (auto fn : ctx.module.fns)
    add(fn, nullptr);
  for (auto obj : ctx.module.objects) {
    for (auto fn : obj->methods)
      add(fn, obj);
  }

  return result;
}

} // namespace npbgen
