// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cassert>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace npbgen {

enum class FieldType {
  Fundamental,
  String,
  Bytes,
  Sequence,
  Optional,
  Map,
  Record,
  Enum,
  Object,
  Receiver,
  Void,
};

enum class Fundamental {
  Boolean,
  Int8,
  UInt8,
  Int16,
  UInt16,
  Int32,
  UInt32,
  Int64,
  UInt64,
  Float32,
  Float64,
};

struct AstTypeDecl {
  FieldType id;

  virtual ~AstTypeDecl() = default;
};

struct AstFundamentalType : AstTypeDecl {
  Fundamental kind;

  AstFundamentalType(Fundamental _kind)
      : kind(_kind)
  {
    id = FieldType::Fundamental;
  }
};

struct AstStringDecl : AstTypeDecl {
  AstStringDecl() { id = FieldType::String; }
};

struct AstBytesDecl : AstTypeDecl {
  AstBytesDecl() { id = FieldType::Bytes; }
};

struct AstVoidDecl : AstTypeDecl {
  AstVoidDecl() { id = FieldType::Void; }
};

// `self` in a parameter list.
struct AstReceiverDecl : AstTypeDecl {
  AstReceiverDecl() { id = FieldType::Receiver; }
};

struct AstWrapType : AstTypeDecl {
  AstTypeDecl* type;

  AstWrapType(FieldType _id, AstTypeDecl* _type)
      : type(_type)
  {
    id = _id;
  }
};

struct AstMapDecl : AstTypeDecl {
  AstTypeDecl* key;
  AstTypeDecl* value;

  AstMapDecl(AstTypeDecl* _key, AstTypeDecl* _value)
      : key(_key)
      , value(_value)
  {
    id = FieldType::Map;
  }
};

// Record, enum or object defined in the native library.
// cpp_name is fully qualified, e.g. futures::MyError.
struct AstNamedType : AstTypeDecl {
  std::string cpp_name;

  AstNamedType(FieldType _id, std::string _cpp_name)
      : cpp_name(std::move(_cpp_name))
  {
    id = _id;
  }
};

constexpr auto cft(const AstTypeDecl* type) noexcept
{
  assert(type->id == FieldType::Fundamental);
  return static_cast<const AstFundamentalType*>(type);
}

constexpr auto cwt(const AstTypeDecl* type) noexcept
{
  assert(type->id == FieldType::Sequence || type->id == FieldType::Optional);
  return static_cast<const AstWrapType*>(type);
}

constexpr auto cmt(const AstTypeDecl* type) noexcept
{
  assert(type->id == FieldType::Map);
  return static_cast<const AstMapDecl*>(type);
}

constexpr auto cnt(const AstTypeDecl* type) noexcept
{
  assert(type->id == FieldType::Record || type->id == FieldType::Enum ||
         type->id == FieldType::Object);
  return static_cast<const AstNamedType*>(type);
}

struct AstParam {
  std::string name;
  AstTypeDecl* type;
};

struct AstFunctionDecl {
  std::string name;
  std::vector<AstParam> params;
  AstTypeDecl* ret;
  AstTypeDecl* error = nullptr;
  bool is_async = false;
  std::optional<std::string> executor;
};

struct AstObjectDecl {
  std::string name;
  std::string cpp_name;
  std::vector<AstFunctionDecl*> methods;
};

struct AstModuleDecl {
  std::string name;
  std::string header;
  // namespace of the native free functions
  std::string cpp_namespace;
  std::vector<AstFunctionDecl*> fns;
  std::vector<AstObjectDecl*> objects;
};

// Owns every node of one declaration file.
class Context
{
  std::filesystem::path file_path_;
  std::vector<std::unique_ptr<AstTypeDecl>> types_;
  std::vector<std::unique_ptr<AstFunctionDecl>> fns_;
  std::vector<std::unique_ptr<AstObjectDecl>> objects_;

public:
  AstModuleDecl module;

  const std::filesystem::path& file_path() const noexcept { return file_path_; }

  template <typename T, typename... Args> T* make_type(Args&&... args)
  {
    auto ptr = std::make_unique<T>(std::forward<Args>(args)...);
    auto raw = ptr.get();
    types_.push_back(std::move(ptr));
    return raw;
  }

  AstFunctionDecl* make_function()
  {
    fns_.push_back(std::make_unique<AstFunctionDecl>());
    return fns_.back().get();
  }

  AstObjectDecl* make_object()
  {
    objects_.push_back(std::make_unique<AstObjectDecl>());
    return objects_.back().get();
  }

  explicit Context(std::filesystem::path file_path = {})
      : file_path_(std::move(file_path))
  {
  }
};

} // namespace npbgen
