// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>

#include <npbridge/abi.h>
#include <npbridge/exception.hpp>

namespace npbridge {

/**
 * @brief Growable byte buffer used to serialize compound values before they
 *        cross the boundary.
 *
 * Memory Layout:
 * +------------------+------------------+
 * |    [readable]    |   [writable]     |
 * +------------------+------------------+
 * ^                  ^                  ^
 * buffer_           out_               capacity_
 *
 * The allocation is compatible with npbridge_buffer: release() hands it over
 * to the foreign side, adopt() takes one back.
 */
class flat_buffer
{
  std::uint8_t* buffer_ = nullptr; // Base allocation pointer
  std::size_t out_ = 0;            // Write position (offset from buffer_)
  std::size_t capacity_ = 0;       // Total allocated capacity

  static constexpr std::size_t default_growth_factor = 2;
  static constexpr std::size_t min_allocation = 64;

  void grow(std::size_t n)
  {
    if (n > std::numeric_limits<std::size_t>::max() - out_)
      throw Exception("buffer capacity overflow");
    std::size_t const required = out_ + n;

    std::size_t new_cap = std::max(capacity_ * default_growth_factor, required);
    new_cap = std::max(new_cap, min_allocation);

    std::uint8_t* new_buf = new std::uint8_t[new_cap];

    if (out_ > 0) {
      std::memcpy(new_buf, buffer_, out_);
    }

    delete[] buffer_;

    buffer_ = new_buf;
    capacity_ = new_cap;
  }

public:
  flat_buffer() = default;

  explicit flat_buffer(std::size_t initial_capacity)
      : buffer_(initial_capacity ? new std::uint8_t[initial_capacity] : nullptr)
      , capacity_(initial_capacity)
  {
  }

  flat_buffer(flat_buffer&& other) noexcept
      : buffer_(other.buffer_)
      , out_(other.out_)
      , capacity_(other.capacity_)
  {
    other.buffer_ = nullptr;
    other.out_ = 0;
    other.capacity_ = 0;
  }

  flat_buffer& operator=(flat_buffer&& other) noexcept
  {
    if (this != &other) {
      delete[] buffer_;

      buffer_ = other.buffer_;
      out_ = other.out_;
      capacity_ = other.capacity_;

      other.buffer_ = nullptr;
      other.out_ = 0;
      other.capacity_ = 0;
    }
    return *this;
  }

  ~flat_buffer() { delete[] buffer_; }

  std::size_t size() const noexcept { return out_; }

  std::size_t capacity() const noexcept { return capacity_; }

  /// Returns room for n more bytes; commit() makes them readable.
  std::uint8_t* prepare(std::size_t n)
  {
    if (n > capacity_ - out_) {
      grow(n);
    }
    return buffer_ + out_;
  }

  void commit(std::size_t n) noexcept { out_ = std::min(out_ + n, capacity_); }

  void append(const void* src, std::size_t n)
  {
    if (n == 0)
      return;
    std::memcpy(prepare(n), src, n);
    commit(n);
  }

  std::uint8_t* data_ptr() noexcept { return buffer_; }

  const std::uint8_t* data_ptr() const noexcept { return buffer_; }

  /// Hand the allocation over to the foreign side.
  npbridge_buffer release() noexcept
  {
    npbridge_buffer rb{capacity_, out_, buffer_};
    buffer_ = nullptr;
    out_ = 0;
    capacity_ = 0;
    return rb;
  }

  /// Throws ConversionFault when the triple is structurally invalid.
  static void check(const npbridge_buffer& rb)
  {
    if (rb.len > rb.capacity)
      throw ConversionFault("buffer length exceeds capacity");
    if (rb.data == nullptr && rb.capacity != 0)
      throw ConversionFault("null buffer data with nonzero capacity");
  }

  /// Take ownership of a buffer that came back across the boundary.
  /// Ownership is not taken when check() throws.
  static flat_buffer adopt(npbridge_buffer rb)
  {
    check(rb);

    flat_buffer fb;
    fb.buffer_ = rb.data;
    fb.capacity_ = static_cast<std::size_t>(rb.capacity);
    fb.out_ = static_cast<std::size_t>(rb.len);
    return fb;
  }
};

/// Bounds-checked cursor over serialized bytes.
class buffer_reader
{
  const std::uint8_t* pos_;
  const std::uint8_t* end_;

public:
  buffer_reader(const std::uint8_t* data, std::size_t size) noexcept
      : pos_(data)
      , end_(data + size)
  {
  }

  explicit buffer_reader(const flat_buffer& fb) noexcept
      : buffer_reader(fb.data_ptr(), fb.size())
  {
  }

  std::size_t remaining() const noexcept
  {
    return static_cast<std::size_t>(end_ - pos_);
  }

  const std::uint8_t* take(std::size_t n)
  {
    if (n > remaining())
      throw ConversionFault("unexpected end of buffer");
    auto p = pos_;
    pos_ += n;
    return p;
  }

  template <typename T> T take_scalar()
  {
    T value;
    std::memcpy(&value, take(sizeof(T)), sizeof(T));
    return value;
  }

  void expect_end() const
  {
    if (pos_ != end_)
      throw ConversionFault("junk data left in buffer after lifting");
  }
};

} // namespace npbridge
