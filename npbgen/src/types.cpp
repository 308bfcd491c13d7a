// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <array>
#include <cctype>

#include "types.hpp"

namespace npbgen {

namespace {
struct FundamentalInfo {
  Fundamental kind;
  std::string_view name;
  std::string_view cpp;
  std::string_view abi;
};

constexpr std::array<FundamentalInfo, 11> fundamentals = {{
    {Fundamental::Boolean, "bool", "bool", "int8_t"},
    {Fundamental::Int8, "i8", "int8_t", "int8_t"},
    {Fundamental::UInt8, "u8", "uint8_t", "uint8_t"},
    {Fundamental::Int16, "i16", "int16_t", "int16_t"},
    {Fundamental::UInt16, "u16", "uint16_t", "uint16_t"},
    {Fundamental::Int32, "i32", "int32_t", "int32_t"},
    {Fundamental::UInt32, "u32", "uint32_t", "uint32_t"},
    {Fundamental::Int64, "i64", "int64_t", "int64_t"},
    {Fundamental::UInt64, "u64", "uint64_t", "uint64_t"},
    {Fundamental::Float32, "f32", "float", "float"},
    {Fundamental::Float64, "f64", "double", "double"},
}};

const FundamentalInfo& info(Fundamental kind)
{
  return fundamentals[static_cast<std::size_t>(kind)];
}

bool is_identifier_path(std::string_view s)
{
  if (s.empty())
    return false;
  std::size_t i = 0;
  while (i < s.size()) {
    if (!(std::isalpha(static_cast<unsigned char>(s[i])) || s[i] == '_'))
      return false;
    while (i < s.size() &&
           (std::isalnum(static_cast<unsigned char>(s[i])) || s[i] == '_'))
      ++i;
    if (i == s.size())
      break;
    if (s.substr(i, 2) != "::")
      return false;
    i += 2;
    if (i == s.size())
      return false;
  }
  return true;
}

// "<...>" body of a generic spelling, or nullopt.
std::optional<std::string_view> generic_body(std::string_view s,
                                             std::string_view prefix)
{
  if (s.size() < prefix.size() + 2 || s.substr(0, prefix.size()) != prefix ||
      s[prefix.size()] != '<' || s.back() != '>')
    return std::nullopt;
  return s.substr(prefix.size() + 1, s.size() - prefix.size() - 2);
}

AstTypeDecl* parse_type_r(Context& ctx, std::string_view s);

// Element types never include void or self.
AstTypeDecl* parse_element(Context& ctx, std::string_view s)
{
  auto type = parse_type_r(ctx, s);
  if (type &&
      (type->id == FieldType::Void || type->id == FieldType::Receiver))
    return nullptr;
  return type;
}

AstTypeDecl* parse_type_r(Context& ctx, std::string_view s)
{
  if (s == "void")
    return ctx.make_type<AstVoidDecl>();
  if (s == "self")
    return ctx.make_type<AstReceiverDecl>();
  if (s == "string")
    return ctx.make_type<AstStringDecl>();
  if (s == "bytes")
    return ctx.make_type<AstBytesDecl>();

  for (const auto& f : fundamentals) {
    if (s == f.name)
      return ctx.make_type<AstFundamentalType>(f.kind);
  }

  if (auto body = generic_body(s, "sequence")) {
    auto inner = parse_element(ctx, *body);
    return inner ? ctx.make_type<AstWrapType>(FieldType::Sequence, inner)
                 : nullptr;
  }

  if (auto body = generic_body(s, "optional")) {
    auto inner = parse_element(ctx, *body);
    return inner ? ctx.make_type<AstWrapType>(FieldType::Optional, inner)
                 : nullptr;
  }

  if (auto body = generic_body(s, "map")) {
    int depth = 0;
    for (std::size_t i = 0; i < body->size(); ++i) {
      char c = (*body)[i];
      if (c == '<')
        ++depth;
      else if (c == '>')
        --depth;
      else if (c == ',' && depth == 0) {
        auto key = parse_element(ctx, body->substr(0, i));
        auto value = parse_element(ctx, body->substr(i + 1));
        if (!key || !value)
          return nullptr;
        if (key->id != FieldType::Fundamental &&
            key->id != FieldType::String && key->id != FieldType::Enum)
          return nullptr;
        return ctx.make_type<AstMapDecl>(key, value);
      }
    }
    return nullptr;
  }

  static constexpr std::pair<std::string_view, FieldType> named[] = {
      {"record:", FieldType::Record},
      {"enum:", FieldType::Enum},
      {"object:", FieldType::Object},
  };
  for (const auto& [prefix, id] : named) {
    if (s.substr(0, prefix.size()) == prefix) {
      auto name = s.substr(prefix.size());
      if (!is_identifier_path(name))
        return nullptr;
      return ctx.make_type<AstNamedType>(id, std::string(name));
    }
  }

  return nullptr;
}
} // namespace

AstTypeDecl* parse_type(Context& ctx, std::string_view str)
{
  std::string s(str);
  s.erase(std::remove_if(s.begin(), s.end(),
                         [](unsigned char c) { return std::isspace(c); }),
          s.end());
  return parse_type_r(ctx, s);
}

std::string canonical_name(const AstTypeDecl* type)
{
  switch (type->id) {
  case FieldType::Fundamental:
    return std::string(
        info(cft(type)->kind).name);
  case FieldType::String:
    return "string";
  case FieldType::Bytes:
    return "bytes";
  case FieldType::Sequence:
    return "sequence<" +
           canonical_name(cwt(type)->type) + ">";
  case FieldType::Optional:
    return "optional<" +
           canonical_name(cwt(type)->type) + ">";
  case FieldType::Map: {
    auto m = cmt(type);
    return "map<" + canonical_name(m->key) + "," + canonical_name(m->value) +
           ">";
  }
  case FieldType::Record:
    return "record:" + cnt(type)->cpp_name;
  case FieldType::Enum:
    return "enum:" + cnt(type)->cpp_name;
  case FieldType::Object:
    return "object:" + cnt(type)->cpp_name;
  case FieldType::Receiver:
    return "self";
  case FieldType::Void:
    return "void";
  }
  return {};
}

std::string cpp_type(const AstTypeDecl* type)
{
  switch (type->id) {
  case FieldType::Fundamental:
    return std::string(
        info(cft(type)->kind).cpp);
  case FieldType::String:
    return "std::string";
  case FieldType::Bytes:
    return "std::vector<uint8_t>";
  case FieldType::Sequence:
    return "std::vector<" +
           cpp_type(cwt(type)->type) + ">";
  case FieldType::Optional:
    return "std::optional<" +
           cpp_type(cwt(type)->type) + ">";
  case FieldType::Map: {
    auto m = cmt(type);
    return "std::map<" + cpp_type(m->key) + ", " + cpp_type(m->value) + ">";
  }
  case FieldType::Record:
  case FieldType::Enum:
    return cnt(type)->cpp_name;
  case FieldType::Object:
    return "npbridge::ObjectPtr<" +
           cnt(type)->cpp_name + ">";
  case FieldType::Receiver:
    // resolved against the owning object by the emitter
    return {};
  case FieldType::Void:
    return "void";
  }
  return {};
}

std::string abi_type(const AstTypeDecl* type)
{
  switch (type->id) {
  case FieldType::Fundamental:
    return std::string(
        info(cft(type)->kind).abi);
  case FieldType::Enum:
    return "int32_t";
  case FieldType::Object:
  case FieldType::Receiver:
    return "npbridge_object_handle";
  case FieldType::Void:
    return "void";
  default:
    return "npbridge_buffer";
  }
}

std::string abi_slot_type(const AstTypeDecl* type)
{
  return type->id == FieldType::Void ? "int8_t" : abi_type(type);
}

std::string mangle(std::string_view canonical)
{
  std::string out;
  out.reserve(canonical.size());
  for (char c : canonical) {
    if (std::isalnum(static_cast<unsigned char>(c))) {
      out.push_back(c);
    } else if (!out.empty() && out.back() != '_') {
      out.push_back('_');
    }
  }
  while (!out.empty() && out.back() == '_')
    out.pop_back();
  return out;
}

} // namespace npbgen
