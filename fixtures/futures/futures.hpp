// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/fusion/include/adapt_struct.hpp>

#include <npbridge/converter.hpp>
#include <npbridge/object.hpp>

// Native library exported by futures.json.
namespace futures {

struct MyError {
  int32_t code;
  std::string reason;
};

enum class Color { Red, Green, Blue };

class Megaphone : public npbridge::Object
{
  std::atomic<uint32_t> calls_{0};

public:
  // Resolves to who, uppercased, after ms milliseconds.
  boost::asio::awaitable<std::string> say_after(uint16_t ms, std::string who);

  uint32_t times_called() const noexcept { return calls_.load(); }
};

std::string greet(std::string who);

boost::asio::awaitable<bool> always_ready();

boost::asio::awaitable<void> void_fn();

boost::asio::awaitable<std::string> say_after(uint16_t ms, std::string who);

boost::asio::awaitable<bool> sleep(uint16_t ms);

// Resolves to "done" after ms milliseconds.
boost::asio::awaitable<std::string> done_after(uint16_t ms);

// How many times the body of done_after has started.
uint32_t done_after_runs();

boost::asio::awaitable<uint8_t> fallible_me(bool do_fail);

// Throws MyError when b is 0.
int32_t divide(int32_t a, int32_t b);

// Out of range index is an invariant violation, not an error.
int32_t checked_index(std::vector<int32_t> values, uint32_t index);

boost::asio::awaitable<std::string> async_fault();

// Same as say_after, run on the io executor.
boost::asio::awaitable<std::string> say_after_with_io(uint16_t ms,
                                                      std::string who);

npbridge::ObjectPtr<Megaphone> new_megaphone();

std::map<std::string, uint32_t> tally(std::vector<std::string> words);

std::optional<std::string> paint(Color color);

} // namespace futures

BOOST_FUSION_ADAPT_STRUCT(futures::MyError, code, reason)

namespace npbridge {
template <> struct EnumTraits<futures::Color> {
  static constexpr uint32_t count = 3;
};
} // namespace npbridge
