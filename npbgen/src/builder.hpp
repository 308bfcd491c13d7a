// Copyright (c) 2021 nikitapnn1@gmail.com
// This file is a part of npsystem (Distributed Control System) and covered by LICENSING file in the topmost directory

#pragma once

#include "ast.hpp"
#include "signature.hpp"
#include <memory>
#include <functional>
#include <algorithm>
#include <ostream>
#include <string>
#include <vector>

namespace npbgen::builders {

template<typename Fn>
struct OstreamWrapper {
    Fn fn;
};

template<typename Fn>
inline std::ostream& operator<<(std::ostream& os, const OstreamWrapper<Fn>& wrapper) {
  wrapper.fn(os);
  return os;
}

class BlockDepth {
  friend std::ostream& operator<<(std::ostream&, const BlockDepth&);
  size_t depth_ = 0;
public:
  BlockDepth& operator --() {
    if (depth_ == 0) depth_ = 1;
    --depth_;
    return *this;
  }

  BlockDepth& operator ++() {
    ++depth_;
    return *this;
  }
};

inline std::ostream& operator<<(std::ostream& os, const BlockDepth& block) {
  for (size_t i = 0; i < block.depth_; ++i) os << "  ";
  return os;
}

class Builder {
protected:
  Context* ctx_;
  BlockDepth block_depth_;

  auto bb(bool newline = true) {
    return OstreamWrapper{[this, newline](std::ostream& os) {
      if (newline)
        os << block_depth_ << "{\n";
      ++block_depth_;
    }};
  }

  auto eb(bool newline = true) {
    return OstreamWrapper{[this, newline](std::ostream& os) {
      --block_depth_;
      if (newline)
        os << block_depth_ << "}\n";
    }};
  }

  auto bl() {
    return OstreamWrapper{[this](std::ostream& os) {
      os << block_depth_;
    }};
  }

  // C prototypes shared by the scaffolding and the C header.
  static std::string invoke_prototype(const ExportedSignature& sig);
  static std::string poll_prototype(const std::string& symbol, const ExportedSignature& sig);
  static std::string release_prototype(const std::string& symbol);

public:
  virtual void emit_module_begin() = 0;
  virtual void emit_export(const ExportedSignature& sig) = 0;
  virtual void emit_module_end() = 0;
  /**
   * @brief Finalize the builder, write any pending data to files.
   */
  virtual void finalize() = 0;

  Builder(Context* ctx): ctx_{ctx} {}
  virtual ~Builder() = default;

  virtual Builder* clone(Context* ctx) const = 0;
};

class BuildGroup {
  Context* ctx_;
  size_t size_;
  std::vector<std::unique_ptr<Builder>> builders_;
public:
  template<typename F, typename... Args>
  void emit(F fptr, Args&&... args) {
    auto mf = std::mem_fn(fptr);
    std::for_each(builders_.begin(), builders_.begin() + size_,
      [&](auto& ptr) { mf(ptr.get(), std::forward<Args>(args)...); }
    );
  }

  template<typename T, typename... Args>
  void add(Args&&... args) {
    builders_.emplace_back(std::make_unique<T>(ctx_, std::forward<Args>(args)...));
    ++size_;
  }

  void finalize() {
    emit(&Builder::finalize);
  }

  size_t size() const noexcept { return size_; }

  BuildGroup(const BuildGroup& other, Context* ctx)
    : ctx_{ctx}
    , size_(other.builders_.size())
  {
    for (size_t i = 0; i < size_; ++i) {
      builders_.emplace_back(other.builders_[i]->clone(ctx));
    }
  }

  BuildGroup(BuildGroup&&) = default;

  BuildGroup(Context* ctx = nullptr) : ctx_{ctx}, size_{ 0 } {}
};

} // namespace npbgen::builders
