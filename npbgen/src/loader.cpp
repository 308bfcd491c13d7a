// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>

#include "declaration_file.hpp"
#include "loader.hpp"
#include "types.hpp"

namespace npbgen {

namespace {
bool is_identifier(std::string_view s)
{
  if (s.empty() ||
      !(std::isalpha(static_cast<unsigned char>(s[0])) || s[0] == '_'))
    return false;
  return std::all_of(s.begin(), s.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '_';
  });
}

class Loader
{
  Context& ctx_;

  [[noreturn]] void fail(std::string_view declaration, const std::string& msg)
  {
    throw declaration_error(ctx_.file_path().string(), declaration, msg);
  }

  std::string required(const std::optional<std::string>& value,
                       const char* key, std::string_view declaration)
  {
    if (!value)
      fail(declaration, std::string("missing '") + key + "'");
    return *value;
  }

  std::string identifier(const std::optional<std::string>& value,
                         const char* key, std::string_view declaration)
  {
    auto s = required(value, key, declaration);
    if (!is_identifier(s))
      fail(declaration,
           std::string("'") + key + "' is not an identifier: '" + s + "'");
    return s;
  }

  AstTypeDecl* type(const std::string& spelling, std::string_view declaration)
  {
    auto t = parse_type(ctx_, spelling);
    if (!t)
      fail(declaration, "unknown type '" + spelling + "'");
    return t;
  }

  AstFunctionDecl* function(const decl::Function& f, const std::string& scope)
  {
    auto fn = ctx_.make_function();
    fn->name = identifier(f.name, "name", scope);
    auto decl = scope + "::" + fn->name;

    for (const auto& p : f.params) {
      AstParam param;
      param.name = identifier(p.name, "name", decl);
      if (!p.type)
        fail(decl, "parameter '" + param.name + "' has no type");
      param.type = type(*p.type, decl);
      if (param.type->id == FieldType::Void)
        fail(decl, "void parameter '" + param.name + "'");
      if (param.name == "npb_status" ||
          (param.name == "self" && param.type->id != FieldType::Receiver))
        fail(decl, "reserved parameter name '" + param.name + "'");
      fn->params.push_back(std::move(param));
    }

    fn->ret = type(f.returns.value_or("void"), decl);
    if (fn->ret->id == FieldType::Receiver)
      fail(decl, "unknown type 'self' in return position");

    if (f.throws) {
      fn->error = type(*f.throws, decl);
      if (fn->error->id == FieldType::Void ||
          fn->error->id == FieldType::Receiver ||
          fn->error->id == FieldType::Object)
        fail(decl, "'" + *f.throws + "' cannot be an error type");
    }

    fn->is_async = f.async;
    fn->executor = f.executor;
    return fn;
  }

public:
  void load(std::istream& is)
  {
    std::string buffer{std::istreambuf_iterator<char>(is),
                       std::istreambuf_iterator<char>()};

    decl::Module root;
    auto error = glz::read_json(root, buffer);
    if (error)
      fail("", "invalid JSON: " + glz::format_error(error, buffer));

    auto& module = ctx_.module;
    module.name = identifier(root.module, "module", "");
    module.header = required(root.header, "header", module.name);
    module.cpp_namespace = root.cpp_namespace.value_or(module.name);

    for (const auto& f : root.functions)
      module.fns.push_back(function(f, module.name));

    for (const auto& o : root.objects) {
      auto obj = ctx_.make_object();
      obj->name = identifier(o.name, "name", module.name);
      obj->cpp_name = required(o.type, "type", module.name + "::" + obj->name);
      auto scope = module.name + "::" + obj->name;
      for (const auto& m : o.methods)
        obj->methods.push_back(function(m, scope));
      module.objects.push_back(obj);
    }
  }

  explicit Loader(Context& ctx)
      : ctx_(ctx)
  {
  }
};
} // namespace

void load_declarations(Context& ctx, std::istream& is)
{
  Loader(ctx).load(is);
}

void load_declarations(Context& ctx)
{
  std::ifstream is(ctx.file_path());
  if (!is)
    throw declaration_error(ctx.file_path().string(), "",
                            "cannot open declaration file");
  load_declarations(ctx, is);
}

} // namespace npbgen
