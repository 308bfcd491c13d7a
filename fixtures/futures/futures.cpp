// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <cctype>
#include <chrono>
#include <limits>
#include <stdexcept>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <npbridge/exception.hpp>

#include "futures.hpp"

namespace futures {

namespace {
std::atomic<uint32_t> g_done_after_runs{0};

boost::asio::awaitable<void> wait_for(uint16_t ms)
{
  boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
  timer.expires_after(std::chrono::milliseconds(ms));
  co_await timer.async_wait(boost::asio::use_awaitable);
}
} // namespace

boost::asio::awaitable<std::string> Megaphone::say_after(uint16_t ms,
                                                         std::string who)
{
  calls_.fetch_add(1);
  co_await wait_for(ms);
  std::transform(who.begin(), who.end(), who.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  co_return "HELLO, " + who + "!";
}

std::string greet(std::string who) { return "Hello, " + who; }

boost::asio::awaitable<bool> always_ready() { co_return true; }

boost::asio::awaitable<void> void_fn() { co_return; }

boost::asio::awaitable<std::string> say_after(uint16_t ms, std::string who)
{
  co_await wait_for(ms);
  co_return "Hello, " + who + "!";
}

boost::asio::awaitable<bool> sleep(uint16_t ms)
{
  co_await wait_for(ms);
  co_return true;
}

boost::asio::awaitable<std::string> done_after(uint16_t ms)
{
  g_done_after_runs.fetch_add(1);
  co_await wait_for(ms);
  co_return "done";
}

uint32_t done_after_runs() { return g_done_after_runs.load(); }

boost::asio::awaitable<uint8_t> fallible_me(bool do_fail)
{
  if (do_fail)
    throw MyError{42, "asked to fail"};
  co_return 42;
}

int32_t divide(int32_t a, int32_t b)
{
  if (b == 0)
    throw MyError{1, "division by zero"};
  if (a == std::numeric_limits<int32_t>::min() && b == -1)
    npbridge::panic("attempt to divide with overflow");
  return a / b;
}

int32_t checked_index(std::vector<int32_t> values, uint32_t index)
{
  if (index >= values.size())
    npbridge::panic("index " + std::to_string(index) + " out of range");
  return values[index];
}

boost::asio::awaitable<std::string> async_fault()
{
  throw std::logic_error("broken invariant");
  co_return "";
}

boost::asio::awaitable<std::string> say_after_with_io(uint16_t ms,
                                                      std::string who)
{
  co_await wait_for(ms);
  co_return "Hello, " + who + "! (from io)";
}

npbridge::ObjectPtr<Megaphone> new_megaphone()
{
  return npbridge::make_object<Megaphone>();
}

std::map<std::string, uint32_t> tally(std::vector<std::string> words)
{
  std::map<std::string, uint32_t> counts;
  for (const auto& w : words)
    ++counts[w];
  return counts;
}

std::optional<std::string> paint(Color color)
{
  switch (color) {
  case Color::Red:
    return "red";
  case Color::Green:
    return "green";
  default:
    return std::nullopt;
  }
}

} // namespace futures
