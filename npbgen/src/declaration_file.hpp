// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <glaze/glaze.hpp>

// Shape of a JSON declaration file as written by the user. Names are
// optional here so the loader can report which one is missing.
namespace npbgen::decl {

struct Param {
  std::optional<std::string> name;
  std::optional<std::string> type;
};

struct Function {
  std::optional<std::string> name;
  std::vector<Param> params;
  std::optional<std::string> returns;
  std::optional<std::string> throws;
  bool async = false;
  std::optional<std::string> executor;
};

struct Object {
  std::optional<std::string> name;
  std::optional<std::string> type;
  std::vector<Function> methods;
};

struct Module {
  std::optional<std::string> module;
  std::optional<std::string> header;
  std::optional<std::string> cpp_namespace;
  std::vector<Function> functions;
  std::vector<Object> objects;
};

} // namespace npbgen::decl

template <>
struct glz::meta<npbgen::decl::Param> {
  using T = npbgen::decl::Param;
  static constexpr auto value = object(
    "name", &T::name,
    "type", &T::type
  );
};

template <>
struct glz::meta<npbgen::decl::Function> {
  using T = npbgen::decl::Function;
  static constexpr auto value = object(
    "name", &T::name,
    "params", &T::params,
    "returns", &T::returns,
    "throws", &T::throws,
    "async", &T::async,
    "executor", &T::executor
  );
};

template <>
struct glz::meta<npbgen::decl::Object> {
  using T = npbgen::decl::Object;
  static constexpr auto value = object(
    "name", &T::name,
    "type", &T::type,
    "methods", &T::methods
  );
};

template <>
struct glz::meta<npbgen::decl::Module> {
  using T = npbgen::decl::Module;
  static constexpr auto value = object(
    "module", &T::module,
    "header", &T::header,
    "namespace", &T::cpp_namespace,
    "functions", &T::functions,
    "objects", &T::objects
  );
};
