// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include <boost/fusion/include/for_each.hpp>
#include <boost/fusion/include/is_sequence.hpp>

#include <npbridge/abi.h>
#include <npbridge/exception.hpp>
#include <npbridge/export.hpp>
#include <npbridge/flat_buffer.hpp>
#include <npbridge/impl/object_registry.hpp>
#include <npbridge/object.hpp>

// Value conversion between native types and their boundary representation.
//
// Every supported type T has an FfiConverter<T> with:
//   abi_type                      - what crosses the boundary at top level
//   abi_type lower(const T&)      - never fails for a well-formed value
//   T lift(abi_type)              - throws ConversionFault on malformed input
//   void write(const T&, flat_buffer&) / T read(buffer_reader&)
//                                 - nested form used inside compound values
//
// Compound values travel as an owned npbridge_buffer. Lifting one takes
// ownership of the buffer and frees it.

namespace npbridge {

// Specialize for every exported enum:
//   template <> struct npbridge::EnumTraits<Color> {
//     static constexpr uint32_t count = 3;
//   };
// Discriminants must be contiguous and start at 0.
template <typename E> struct EnumTraits;

template <typename T, typename Enable = void> struct FfiConverter {
  static_assert(sizeof(T) == 0,
                "type has no boundary representation; add an FfiConverter");
};

namespace impl {
NPBRIDGE_API bool is_valid_utf8(const std::uint8_t* data,
                                std::size_t size) noexcept;

inline void write_length(std::size_t n, flat_buffer& buf)
{
  if (n > static_cast<std::size_t>(std::numeric_limits<int32_t>::max()))
    panic("value too large for the boundary");
  auto len = static_cast<int32_t>(n);
  buf.append(&len, sizeof(len));
}

inline std::size_t read_length(buffer_reader& r)
{
  auto len = r.take_scalar<int32_t>();
  if (len < 0)
    throw ConversionFault("negative length");
  return static_cast<std::size_t>(len);
}

template <typename T, typename Derived> struct BufferConverter {
  using abi_type = npbridge_buffer;

  static npbridge_buffer lower(const T& v)
  {
    flat_buffer buf;
    Derived::write(v, buf);
    return buf.release();
  }

  static T lift(npbridge_buffer rb)
  {
    auto buf = flat_buffer::adopt(rb);
    buffer_reader r(buf);
    T v = Derived::read(r);
    r.expect_end();
    return v;
  }
};

template <typename T> struct ScalarConverter {
  using abi_type = T;

  static abi_type lower(T v) noexcept { return v; }
  static T lift(abi_type v) noexcept { return v; }
  static void write(T v, flat_buffer& buf) { buf.append(&v, sizeof(T)); }
  static T read(buffer_reader& r) { return r.take_scalar<T>(); }
};
} // namespace impl

template <typename T>
struct FfiConverter<
    T, std::enable_if_t<std::is_arithmetic_v<T> && !std::is_same_v<T, bool>>>
    : impl::ScalarConverter<T> {
};

template <> struct FfiConverter<bool> {
  using abi_type = int8_t;

  static abi_type lower(bool v) noexcept { return v ? 1 : 0; }

  static bool lift(abi_type v)
  {
    switch (v) {
    case 0:
      return false;
    case 1:
      return true;
    default:
      throw ConversionFault("unexpected byte for Boolean");
    }
  }

  static void write(bool v, flat_buffer& buf)
  {
    impl::ScalarConverter<int8_t>::write(lower(v), buf);
  }

  static bool read(buffer_reader& r)
  {
    return lift(impl::ScalarConverter<int8_t>::read(r));
  }
};

template <> struct FfiConverter<std::string> {
  using abi_type = npbridge_buffer;

  static npbridge_buffer lower(const std::string& v)
  {
    flat_buffer buf(v.size());
    buf.append(v.data(), v.size());
    return buf.release();
  }

  static std::string lift(npbridge_buffer rb)
  {
    auto buf = flat_buffer::adopt(rb);
    if (!impl::is_valid_utf8(buf.data_ptr(), buf.size()))
      throw ConversionFault("invalid UTF-8 in string");
    return std::string(reinterpret_cast<const char*>(buf.data_ptr()),
                       buf.size());
  }

  static void write(const std::string& v, flat_buffer& buf)
  {
    impl::write_length(v.size(), buf);
    buf.append(v.data(), v.size());
  }

  static std::string read(buffer_reader& r)
  {
    auto len = impl::read_length(r);
    auto p = r.take(len);
    if (!impl::is_valid_utf8(p, len))
      throw ConversionFault("invalid UTF-8 in string");
    return std::string(reinterpret_cast<const char*>(p), len);
  }
};

// Opaque bytes. Top level the buffer holds the raw bytes.
template <> struct FfiConverter<std::vector<uint8_t>> {
  using abi_type = npbridge_buffer;

  static npbridge_buffer lower(const std::vector<uint8_t>& v)
  {
    flat_buffer buf(v.size());
    buf.append(v.data(), v.size());
    return buf.release();
  }

  static std::vector<uint8_t> lift(npbridge_buffer rb)
  {
    auto buf = flat_buffer::adopt(rb);
    return std::vector<uint8_t>(buf.data_ptr(), buf.data_ptr() + buf.size());
  }

  static void write(const std::vector<uint8_t>& v, flat_buffer& buf)
  {
    impl::write_length(v.size(), buf);
    buf.append(v.data(), v.size());
  }

  static std::vector<uint8_t> read(buffer_reader& r)
  {
    auto len = impl::read_length(r);
    auto p = r.take(len);
    return std::vector<uint8_t>(p, p + len);
  }
};

template <typename T>
struct FfiConverter<std::vector<T>,
                    std::enable_if_t<!std::is_same_v<T, uint8_t>>>
    : impl::BufferConverter<std::vector<T>, FfiConverter<std::vector<T>>> {
  static void write(const std::vector<T>& v, flat_buffer& buf)
  {
    impl::write_length(v.size(), buf);
    for (const auto& item : v)
      FfiConverter<T>::write(item, buf);
  }

  static std::vector<T> read(buffer_reader& r)
  {
    auto len = impl::read_length(r);
    std::vector<T> v;
    // every item takes at least one byte
    if (len > r.remaining())
      throw ConversionFault("sequence length exceeds buffer");
    v.reserve(len);
    for (std::size_t i = 0; i < len; ++i)
      v.push_back(FfiConverter<T>::read(r));
    return v;
  }
};

template <typename T>
struct FfiConverter<std::optional<T>>
    : impl::BufferConverter<std::optional<T>, FfiConverter<std::optional<T>>> {
  static void write(const std::optional<T>& v, flat_buffer& buf)
  {
    int8_t tag = v.has_value() ? 1 : 0;
    buf.append(&tag, sizeof(tag));
    if (v)
      FfiConverter<T>::write(*v, buf);
  }

  static std::optional<T> read(buffer_reader& r)
  {
    switch (r.take_scalar<int8_t>()) {
    case 0:
      return std::nullopt;
    case 1:
      return FfiConverter<T>::read(r);
    default:
      throw ConversionFault("unexpected tag byte for Optional");
    }
  }
};

template <typename K, typename V>
struct FfiConverter<std::map<K, V>>
    : impl::BufferConverter<std::map<K, V>, FfiConverter<std::map<K, V>>> {
  static void write(const std::map<K, V>& v, flat_buffer& buf)
  {
    impl::write_length(v.size(), buf);
    for (const auto& [key, value] : v) {
      FfiConverter<K>::write(key, buf);
      FfiConverter<V>::write(value, buf);
    }
  }

  static std::map<K, V> read(buffer_reader& r)
  {
    auto len = impl::read_length(r);
    std::map<K, V> v;
    for (std::size_t i = 0; i < len; ++i) {
      auto key = FfiConverter<K>::read(r);
      auto value = FfiConverter<V>::read(r);
      if (!v.emplace(std::move(key), std::move(value)).second)
        throw ConversionFault("duplicate key in Map");
    }
    return v;
  }
};

template <typename E>
struct FfiConverter<E, std::enable_if_t<std::is_enum_v<E>>> {
  using abi_type = int32_t;

  static abi_type lower(E v) noexcept { return static_cast<abi_type>(v); }

  static E lift(abi_type v)
  {
    if (v < 0 || static_cast<uint32_t>(v) >= EnumTraits<E>::count)
      throw ConversionFault("invalid enum discriminant " + std::to_string(v));
    return static_cast<E>(v);
  }

  static void write(E v, flat_buffer& buf)
  {
    impl::ScalarConverter<int32_t>::write(lower(v), buf);
  }

  static E read(buffer_reader& r)
  {
    return lift(impl::ScalarConverter<int32_t>::read(r));
  }
};

// Records: structs adapted with BOOST_FUSION_ADAPT_STRUCT, fields in order.
template <typename T>
struct FfiConverter<
    T, std::enable_if_t<boost::fusion::traits::is_sequence<T>::value>>
    : impl::BufferConverter<T, FfiConverter<T>> {
  static void write(const T& v, flat_buffer& buf)
  {
    boost::fusion::for_each(v, [&buf](const auto& field) {
      FfiConverter<std::decay_t<decltype(field)>>::write(field, buf);
    });
  }

  static T read(buffer_reader& r)
  {
    T v{};
    boost::fusion::for_each(v, [&r](auto& field) {
      field = FfiConverter<std::decay_t<decltype(field)>>::read(r);
    });
    return v;
  }
};

template <typename T> struct FfiConverter<ObjectPtr<T>> {
  using abi_type = npbridge_object_handle;

  static abi_type lower(const ObjectPtr<T>& v)
  {
    if (!v)
      panic("cannot pass a null object across the boundary");
    return impl::ObjectRegistry::instance().lower(ObjectPtr<Object>(v));
  }

  static ObjectPtr<T> lift(abi_type handle)
  {
    return impl::ObjectRegistry::instance().take<T>(handle);
  }

  static void write(const ObjectPtr<T>& v, flat_buffer& buf)
  {
    impl::ScalarConverter<uint64_t>::write(lower(v), buf);
  }

  static ObjectPtr<T> read(buffer_reader& r)
  {
    return lift(impl::ScalarConverter<uint64_t>::read(r));
  }
};

// Serializes any convertible value into a standalone buffer, the form used
// for typed error payloads.
template <typename T> npbridge_buffer lower_into_buffer(const T& v)
{
  flat_buffer buf;
  FfiConverter<T>::write(v, buf);
  return buf.release();
}

template <typename T> T lift_from_buffer(npbridge_buffer rb)
{
  auto buf = flat_buffer::adopt(rb);
  buffer_reader r(buf);
  T v = FfiConverter<T>::read(r);
  r.expect_end();
  return v;
}

} // namespace npbridge

namespace npbridge {

// Shape of the output slot for a return type. void returns fill an int8_t.
template <typename T> struct AbiReturn {
  using type = typename FfiConverter<T>::abi_type;
};

template <> struct AbiReturn<void> {
  using type = int8_t;
};

template <typename T> using abi_return_t = typename AbiReturn<T>::type;

} // namespace npbridge
